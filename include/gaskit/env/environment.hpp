#pragma once

#include <vector>
#include <optional>
#include <cstdint>

#include "gaskit/defaults.hpp"
#include "gaskit/env/particle.hpp"


namespace gaskit::env {

    class Environment;

    namespace internal {
        struct EnvironmentData {
            std::vector<Particle> particles;    // explicitly placed particles
            size_t particle_count = defaults::particle_count;
            vec2 extent = {defaults::domain_width, defaults::domain_height};
            double radius = defaults::particle_radius;
            double restitution = defaults::restitution;
            double speed_scale = defaults::speed_scale;
            double temperature = defaults::temperature;
            uint64_t seed = defaults::seed;
        };

        const EnvironmentData & get_env_data(const Environment & env);
    }


    // Build description of a kinetics simulation. Nothing is validated here,
    // core::build_system checks the configuration as a whole.
    class Environment {
    public:
        Environment() = default;

        // --- Add particles ---
        // Explicit particles replace the randomly generated ensemble and the particle count.
        // All particles share one radius, so theirs is replaced by the environment radius.
        void add_particle(const Particle& particle) {
            data.particles.push_back(particle);
        }

        void add_particle(const vec2& position, const vec2& velocity) {
            add_particle(Particle().at(position).with_velocity(velocity));
        }

        void add_particles(const std::vector<Particle>& particles) {
            data.particles.reserve(data.particles.size() + particles.size());
            for (auto & p : particles) add_particle(p);
        }

        // --- Ensemble ---
        void set_particle_count(const size_t n) { data.particle_count = n; }
        void set_radius(const double r) { data.radius = r; }
        void set_seed(const uint64_t seed) { data.seed = seed; }

        // --- Dynamics ---
        void set_restitution(const double e) { data.restitution = e; }
        void set_speed_scale(const double k) { data.speed_scale = k; }
        void set_temperature(const double T) { data.temperature = T; }

        // --- Set Domain ---
        void set_extent(const vec2& extent) { data.extent = extent; }
        void set_extent(const double w, const double h) { set_extent({w, h}); }


        // --- DSL-style chaining helpers ---
        Environment& with_particle(const Particle& particle) {
            add_particle(particle); return *this;
        }
        Environment& with_particle(const vec2& position, const vec2& velocity) {
            add_particle(position, velocity); return *this;
        }
        Environment& with_particles(const std::vector<Particle>& particles) {
            add_particles(particles); return *this;
        }
        Environment& with_particle_count(const size_t n) {
            set_particle_count(n); return *this;
        }
        Environment& with_radius(const double r) {
            set_radius(r); return *this;
        }
        Environment& with_seed(const uint64_t seed) {
            set_seed(seed); return *this;
        }
        Environment& with_restitution(const double e) {
            set_restitution(e); return *this;
        }
        Environment& with_speed_scale(const double k) {
            set_speed_scale(k); return *this;
        }
        Environment& with_temperature(const double T) {
            set_temperature(T); return *this;
        }
        Environment& with_extent(const vec2& extent) {
            set_extent(extent); return *this;
        }
        Environment& with_extent(const double w, const double h) {
            set_extent(w, h); return *this;
        }

    private:
        internal::EnvironmentData data;

        friend const internal::EnvironmentData & internal::get_env_data(const Environment& env);
    };


    namespace internal {
        inline const EnvironmentData & get_env_data(const Environment & env) {
            return env.data;
        }
    }

} // namespace gaskit::env
