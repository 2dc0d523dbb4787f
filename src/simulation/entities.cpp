#include "entities.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

float Ball::speed() const noexcept { return std::hypot(vx, vy); }

Rectangle Ball::bounds() const noexcept {
    return Rectangle{x - radius, y - radius, radius * 2.f, radius * 2.f};
}

Paddle::Paddle(float x, float y, float width, float height, float speed,
               float max_bounce_angle_deg, float ball_speed,
               float settle_epsilon)
    : m_x(x), m_y(y), m_target(x), m_width(width), m_height(height),
      m_speed(speed), m_max_bounce_angle_deg(max_bounce_angle_deg),
      m_ball_speed(ball_speed), m_settle_epsilon(settle_epsilon) {
    if (width <= 0.f || height <= 0.f) {
        throw gridbreak::ConfigError(
            fmt::format("Invalid paddle size: {}x{}", width, height));
    }
    if (speed <= 0.f || ball_speed <= 0.f) {
        throw gridbreak::ConfigError(fmt::format(
            "Invalid paddle/ball speed: {}/{}", speed, ball_speed));
    }
}

void Paddle::step() noexcept {
    const float remaining = m_target - m_x;
    if (std::abs(remaining) > m_speed) {
        m_x += (remaining > 0.f) ? m_speed : -m_speed;
    } else {
        m_x = m_target;
    }
}

bool Paddle::is_stationary() const noexcept {
    return std::abs(m_x - m_target) < m_settle_epsilon;
}

Vector2 Paddle::bounce_velocity(float ball_x) const noexcept {
    const float half_width = m_width * 0.5f;
    const float offset = std::clamp((ball_x - m_x) / half_width, -1.f, 1.f);
    const float angle =
        offset * m_max_bounce_angle_deg * std::numbers::pi_v<float> / 180.f;

    return Vector2{m_ball_speed * std::sin(angle),
                   -std::abs(m_ball_speed * std::cos(angle))};
}

Rectangle Paddle::bounds() const noexcept {
    return Rectangle{m_x - m_width * 0.5f, m_y, m_width, m_height};
}

Brick::Brick(int col, int row, int strength, Color color, int level, int count)
    : m_col(col), m_row(row), m_strength(strength), m_max_strength(strength),
      m_color(color), m_level(level), m_count(count) {}

bool Brick::take_damage(int amount) noexcept {
    if (m_destroyed || amount <= 0) {
        return false;
    }

    m_strength -= amount;
    if (m_strength <= 0) {
        m_destroyed = true;
        return true;
    }
    return false;
}

float Brick::strength_ratio() const noexcept {
    if (m_max_strength <= 0) {
        return 0.f;
    }
    return std::clamp((float)m_strength / (float)m_max_strength, 0.f, 1.f);
}

Explosion::Explosion(Vector2 center, int lifetime, float max_radius,
                     std::vector<Particle> particles)
    : m_center(center), m_lifetime(lifetime), m_max_radius(max_radius),
      m_particles(std::move(particles)) {}

Explosion Explosion::spawn(Vector2 center, int lifetime, float max_radius,
                           int particle_count, std::mt19937 &rng) {
    std::uniform_real_distribution<float> speed(0.5f, 1.5f);
    std::uniform_real_distribution<float> brightness(0.7f, 1.0f);

    std::vector<Particle> particles;
    particles.reserve(std::max(0, particle_count));
    for (int i = 0; i < particle_count; ++i) {
        const float angle =
            (float)i / (float)particle_count * 2.f * std::numbers::pi_v<float>;
        const float s = speed(rng);
        particles.push_back({angle, s, brightness(rng)});
    }

    return Explosion(center, lifetime, max_radius, std::move(particles));
}

float Explosion::progress() const noexcept {
    return std::min(1.f, (float)m_elapsed / (float)m_lifetime);
}
