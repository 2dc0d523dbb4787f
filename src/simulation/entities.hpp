#pragma once

#include <random>
#include <vector>

#include <raylib.h>

/**
 * @brief The ball: centre position, per-frame velocity and a fixed radius
 *
 * Moves blindly; keeping it inside the playfield is the collision
 * resolver's job.
 */
struct Ball {
    float x = 0.f;
    float y = 0.f;
    float vx = 0.f;
    float vy = 0.f;
    float radius = 0.f;

    /** @brief Advances the ball by one frame of velocity */
    inline void step() noexcept {
        x += vx;
        y += vy;
    }

    /** @brief Speed magnitude, pixels per frame */
    float speed() const noexcept;

    /** @brief Axis-aligned bounding box of the ball */
    Rectangle bounds() const noexcept;
};

/**
 * @brief Horizontally moving paddle driven toward a target x
 *
 * x is the paddle's centre, y its top edge.
 */
class Paddle {
  public:
    /**
     * @brief Creates a stationary paddle (target == position)
     * @param x Centre x in pixels
     * @param y Top edge in pixels
     * @param width Width in pixels
     * @param height Height in pixels
     * @param speed Maximum displacement per frame
     * @param max_bounce_angle_deg Bounce angle from vertical at the very edge
     * @param ball_speed Speed given to the ball on every bounce
     * @param settle_epsilon Distance to target under which the paddle counts
     * as stationary
     * @throws gridbreak::ConfigError on non-positive size or speeds
     */
    Paddle(float x, float y, float width, float height, float speed,
           float max_bounce_angle_deg, float ball_speed, float settle_epsilon);

    /**
     * @brief Moves at most speed pixels toward the target, snapping onto it
     * when it is within reach
     */
    void step() noexcept;

    /** @brief Stores a new target; the paddle moves on the next step() */
    inline void set_target(float target_x) noexcept { m_target = target_x; }

    /** @brief True when |x - target| is below the settle epsilon */
    bool is_stationary() const noexcept;

    /**
     * @brief Ball velocity after bouncing off this paddle at ball_x
     *
     * The hit offset from the centre, normalised to [-1, 1], maps linearly to
     * an angle from vertical up to the configured maximum. The result always
     * points upward and has the configured ball speed.
     */
    Vector2 bounce_velocity(float ball_x) const noexcept;

    /** @brief Bounding box (x - width/2, y, width, height) */
    Rectangle bounds() const noexcept;

    inline float x() const noexcept { return m_x; }
    inline float y() const noexcept { return m_y; }
    inline float target() const noexcept { return m_target; }
    inline float width() const noexcept { return m_width; }
    inline float height() const noexcept { return m_height; }
    inline float speed() const noexcept { return m_speed; }

  private:
    float m_x;
    float m_y;
    float m_target;
    float m_width;
    float m_height;
    float m_speed;
    float m_max_bounce_angle_deg;
    float m_ball_speed;
    float m_settle_epsilon;
};

/**
 * @brief A grid cell turned into a destructible brick
 *
 * Bricks are never removed from their owning collection; destruction only
 * flips a flag so a brick keeps its index and grid position for the whole
 * run.
 */
class Brick {
  public:
    Brick(int col, int row, int strength, Color color, int level, int count);

    /**
     * @brief Applies damage
     * @param amount Hits to subtract; non-positive amounts are ignored
     * @return True only on the hit that destroys the brick
     */
    bool take_damage(int amount = 1) noexcept;

    inline int col() const noexcept { return m_col; }
    inline int row() const noexcept { return m_row; }
    inline int strength() const noexcept { return m_strength; }
    inline int max_strength() const noexcept { return m_max_strength; }
    inline Color color() const noexcept { return m_color; }
    inline int level() const noexcept { return m_level; }
    inline int count() const noexcept { return m_count; }
    inline bool is_destroyed() const noexcept { return m_destroyed; }

    /** @brief Remaining strength over initial strength, clamped to [0, 1] */
    float strength_ratio() const noexcept;

  private:
    int m_col;
    int m_row;
    int m_strength;
    int m_max_strength;
    Color m_color;
    int m_level;
    int m_count;
    bool m_destroyed = false;
};

/**
 * @brief Short-lived burst left behind by a destroyed brick
 */
class Explosion {
  public:
    struct Particle {
        float angle;
        float speed;
        float brightness;
    };

    Explosion(Vector2 center, int lifetime, float max_radius,
              std::vector<Particle> particles);

    /**
     * @brief Creates an explosion with evenly spread particle angles and
     * random speed (0.5..1.5) and brightness (0.7..1.0)
     * @param rng Generator owned by the caller, so runs stay reproducible
     */
    static Explosion spawn(Vector2 center, int lifetime, float max_radius,
                           int particle_count, std::mt19937 &rng);

    inline void step() noexcept { ++m_elapsed; }
    inline bool is_finished() const noexcept { return m_elapsed >= m_lifetime; }

    /** @brief elapsed / lifetime */
    float progress() const noexcept;

    inline Vector2 center() const noexcept { return m_center; }
    inline int elapsed() const noexcept { return m_elapsed; }
    inline int lifetime() const noexcept { return m_lifetime; }
    inline float max_radius() const noexcept { return m_max_radius; }
    inline const std::vector<Particle> &particles() const noexcept {
        return m_particles;
    }

  private:
    Vector2 m_center;
    int m_lifetime;
    int m_elapsed = 0;
    float m_max_radius;
    std::vector<Particle> m_particles;
};
