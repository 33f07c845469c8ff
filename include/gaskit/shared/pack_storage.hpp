#pragma once
#include <tuple>
#include <vector>
#include <utility>

#include "gaskit/base/types.hpp"


namespace gaskit::shared::internal {

	template<class... Ts>
	class PackStorage {
	public:
		PackStorage() = default;

		// Add one component of type T
		template <class T>
		requires (same_as_any<T, Ts...>)
		void add(T component) {
			std::get<std::vector<T>>(components).push_back(std::move(component));
		}

		// Generic loop over every single component item
		// e.g., for_each_item([&](auto& item){ item.update(...); });
		template<typename Func>
		void for_each_item(Func&& f) {
			std::apply(
				[&](auto&... list) {
					(for_each_in(list, f), ...);
				},
				components
			);
		}

		// Get the vector for a specific type T
		template<typename T>
		std::vector<T>& get_list() {
			return std::get<std::vector<T>>(components);
		}

	private:
		std::tuple<std::vector<Ts>...> components{};

		template<typename List, typename Func>
		static void for_each_in(List & list, Func & f) {
			for (auto& item : list) {
				f(item);
			}
		}
	};
}
