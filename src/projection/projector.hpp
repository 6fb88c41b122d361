#pragma once

/// @file projector.hpp
/// @brief Rotation-matrix pinhole projection between NWU world directions and screen points.

#include "core/types.hpp"
#include "geo/geo_math.hpp"

#include <optional>

namespace skyradar::projection
{
    /// @brief Angular field of view of the display (full spans, degrees).
    struct FieldOfView
    {
        f64 horizontal_deg = 60.0;
        f64 vertical_deg   = 90.0;
    };

    /// @brief Static projection utilities.
    ///
    /// World frame is North-West-Up. Device frame: +x right, +y up,
    /// +z out of the screen toward the viewer, so a target is in front
    /// of the device iff its device-frame z is negative. The rotation
    /// matrix maps world → device: device = R · world.
    class Projector
    {
    public:
        Projector() = delete;

        /// @brief Project a world direction to a screen point.
        ///
        /// angleX = atan2(d.x, −d.z), angleY = atan2(d.y, −d.z), mapped linearly
        /// so ±FOV/2 lands on the screen edges. No clamping: points may fall
        /// outside the viewport.
        ///
        /// @return Screen point, or std::nullopt when d.z >= 0 (behind or on the image plane).
        [[nodiscard]] static std::optional<ScreenPoint> project_to_screen(
            const Vec3d& world_direction,
            const RotationMatrix& rotation,
            const FieldOfView& fov,
            const ScreenSize& screen
        );

        /// @brief Inverse projection: world-frame unit ray through a screen point.
        [[nodiscard]] static Vec3d screen_ray(
            const ScreenPoint& point,
            const RotationMatrix& rotation,
            const FieldOfView& fov,
            const ScreenSize& screen
        );

        /// @brief NWU unit direction from an observer to a geographic target.
        ///
        /// Azimuth is the initial great-circle bearing; elevation is the
        /// straight chord through the Earth (true_elevation_angle).
        [[nodiscard]] static Vec3d direction_vector(
            const geo::GeoPoint& from,
            const geo::GeoPoint& to,
            f64 earth_radius_m = geo_constants::kEarthRadiusM
        );

        /// @brief Compass heading of the device's forward axis, [0, 360).
        [[nodiscard]] static f64 heading_from_rotation_matrix(const RotationMatrix& rotation);

        /// @brief Build a world → device matrix from its three rows.
        ///
        /// Each row is a device axis (x, y, z) expressed in world coordinates,
        /// matching the row-major layout delivered by motion sensors.
        [[nodiscard]] static RotationMatrix rotation_from_rows(
            const Vec3d& row0,
            const Vec3d& row1,
            const Vec3d& row2
        );

        /// @brief Matrix for an upright device turned to a heading and tilted up by pitch.
        /// @param heading_deg Compass heading of the forward axis (0 = North, clockwise).
        /// @param pitch_deg Forward axis elevation (+90 = looking straight up).
        [[nodiscard]] static RotationMatrix rotation_facing(f64 heading_deg, f64 pitch_deg);
    };

} // namespace skyradar::projection
