/// @file projector.cpp
/// @brief Implementation of the rotation-matrix pinhole projector.

#include "projection/projector.hpp"

#include "geo/geo_math.hpp"

#include <glm/geometric.hpp>
#include <glm/matrix.hpp>

#include <cmath>

namespace skyradar::projection
{

using astro_constants::kDegToRad;
using astro_constants::kRadToDeg;

// -----------------------------------------------------------------
// World direction → screen point
//
//   d  = R · w
//   visible iff d.z < 0
//   ax = atan2(d.x, −d.z),  ay = atan2(d.y, −d.z)
//   px = w/2 + ax / (hfov/2) × w/2
//   py = h/2 − ay / (vfov/2) × h/2
// -----------------------------------------------------------------

std::optional<ScreenPoint> Projector::project_to_screen(
    const Vec3d& world_direction,
    const RotationMatrix& rotation,
    const FieldOfView& fov,
    const ScreenSize& screen)
{
    const Vec3d device = rotation * world_direction;

    // The negated comparison also rejects NaN components
    if (!(device.z < 0.0))
    {
        return std::nullopt;
    }

    const f64 angle_x = std::atan2(device.x, -device.z);
    const f64 angle_y = std::atan2(device.y, -device.z);

    const f64 half_width  = screen.width * 0.5;
    const f64 half_height = screen.height * 0.5;
    const f64 half_hfov = fov.horizontal_deg * 0.5 * kDegToRad;
    const f64 half_vfov = fov.vertical_deg * 0.5 * kDegToRad;

    return ScreenPoint{
        half_width + (angle_x / half_hfov) * half_width,
        half_height - (angle_y / half_vfov) * half_height,
    };
}

// -----------------------------------------------------------------
// Screen point → world ray
//
// Invert the linear angle mapping, rebuild the device ray with
// −z = 1 (so atan2(x, −z) = ax), normalize, rotate back with Rᵀ.
// -----------------------------------------------------------------

Vec3d Projector::screen_ray(
    const ScreenPoint& point,
    const RotationMatrix& rotation,
    const FieldOfView& fov,
    const ScreenSize& screen)
{
    const f64 half_width  = screen.width * 0.5;
    const f64 half_height = screen.height * 0.5;

    const f64 angle_x = (point.x - half_width) / half_width * (fov.horizontal_deg * 0.5 * kDegToRad);
    const f64 angle_y = (half_height - point.y) / half_height * (fov.vertical_deg * 0.5 * kDegToRad);

    const Vec3d device = glm::normalize(Vec3d{std::tan(angle_x), std::tan(angle_y), -1.0});
    return glm::transpose(rotation) * device;
}

Vec3d Projector::direction_vector(const geo::GeoPoint& from, const geo::GeoPoint& to, f64 earth_radius_m)
{
    const f64 azimuth = geo::GeoMath::bearing(from, to) * kDegToRad;
    const f64 distance = geo::GeoMath::distance(from, to, earth_radius_m);
    const f64 elevation = geo::GeoMath::true_elevation_angle(distance, earth_radius_m);

    const f64 cos_el = std::cos(elevation);
    return Vec3d{cos_el * std::cos(azimuth), -cos_el * std::sin(azimuth), std::sin(elevation)};
}

// -----------------------------------------------------------------
// Heading: forward axis (0, 0, −1) back into the world frame
// -----------------------------------------------------------------

f64 Projector::heading_from_rotation_matrix(const RotationMatrix& rotation)
{
    const Vec3d forward = glm::transpose(rotation) * Vec3d{0.0, 0.0, -1.0};
    const f64 north = forward.x;
    const f64 west  = forward.y;

    return geo::GeoMath::wrap_degrees(std::atan2(-west, north) * kRadToDeg);
}

RotationMatrix Projector::rotation_from_rows(const Vec3d& row0, const Vec3d& row1, const Vec3d& row2)
{
    // glm stores columns, so the rows go in as columns and get transposed
    return glm::transpose(RotationMatrix{row0, row1, row2});
}

// -----------------------------------------------------------------
// Upright device at (heading, pitch)
//
//   forward f = (cos p cos h, −cos p sin h, sin p)
//   right   r = (−sin h, −cos h, 0)
//   up      u = (−f) × r
//
// Rows are the device axes in world coordinates: x = r, y = u, z = −f.
// -----------------------------------------------------------------

RotationMatrix Projector::rotation_facing(f64 heading_deg, f64 pitch_deg)
{
    const f64 h = heading_deg * kDegToRad;
    const f64 p = pitch_deg * kDegToRad;

    const Vec3d forward{std::cos(p) * std::cos(h), -std::cos(p) * std::sin(h), std::sin(p)};
    const Vec3d right{-std::sin(h), -std::cos(h), 0.0};
    const Vec3d up = glm::cross(-forward, right);

    return rotation_from_rows(right, up, -forward);
}

} // namespace skyradar::projection
