/// @file entity_resolver.cpp
/// @brief Implementation of per-frame entity placement.

#include "scene/entity_resolver.hpp"

#include "projection/projector.hpp"

#include <glm/geometric.hpp>

namespace skyradar::scene
{

using geo::GeoMath;
using projection::Projector;

EntityResolver::EntityResolver(const RadarConfig& config,
                               const geo::GeoPoint& observer,
                               const RotationMatrix& rotation,
                               const ScreenSize& screen)
    : m_config(config)
    , m_observer(observer)
    , m_rotation(rotation)
    , m_screen(screen)
{
}

bool EntityResolver::is_fresh(const Friend& person, f64 now_jd) const
{
    if (!person.location)
    {
        return false;
    }

    const f64 age_s = (now_jd - person.location->timestamp_jd) * astro_constants::kSecondsPerDay;
    return age_s <= m_config.friend_staleness_s;
}

std::optional<ResolvedFriend> EntityResolver::resolve_friend(const Friend& person, f64 now_jd) const
{
    if (!is_fresh(person, now_jd))
    {
        return std::nullopt;
    }

    const auto& target = person.location->position;
    const auto screen = project(target);
    if (!screen)
    {
        return std::nullopt;
    }

    return ResolvedFriend{
        .person      = person,
        .screen      = *screen,
        .distance_m  = GeoMath::distance(m_observer, target, m_config.earth_radius_m),
        .bearing_deg = GeoMath::bearing(m_observer, target),
    };
}

std::optional<ResolvedLandmark> EntityResolver::resolve_landmark(
    const catalog::Landmark& landmark,
    const LandmarkSettings& settings) const
{
    if (!settings.is_enabled(landmark.id))
    {
        return std::nullopt;
    }

    const auto screen = project(landmark.position);
    if (!screen)
    {
        return std::nullopt;
    }

    return ResolvedLandmark{
        .landmark    = landmark,
        .screen      = *screen,
        .distance_m  = GeoMath::distance(m_observer, landmark.position, m_config.earth_radius_m),
        .bearing_deg = GeoMath::bearing(m_observer, landmark.position),
    };
}

ResolvedBody EntityResolver::resolve_celestial(const astro::HorizontalPosition& position) const
{
    return ResolvedBody{
        .position = position,
        .screen   = Projector::project_to_screen(astro::Coordinates::horizontal_to_world(position),
                                                 m_rotation, m_config.field_of_view(), m_screen),
    };
}

// -----------------------------------------------------------------
// Target indicator
//
// The arrow hides ("found") once the target projects in front of the
// device, not off the left edge, and within target_found_radius_px of
// the screen centre.
// -----------------------------------------------------------------

std::optional<TargetIndicator> EntityResolver::resolve_target(const Friend& person, f64 heading_deg) const
{
    if (!person.location)
    {
        return std::nullopt;
    }

    const auto& target = person.location->position;
    const auto screen = project(target);

    bool found = false;
    if (screen && screen->x >= 0.0)
    {
        const ScreenPoint centre{m_screen.width * 0.5, m_screen.height * 0.5};
        found = glm::distance(*screen, centre) <= m_config.target_found_radius_px;
    }

    return TargetIndicator{
        .friend_id       = person.id,
        .screen          = screen,
        .arrow_angle_deg = GeoMath::relative_bearing(GeoMath::bearing(m_observer, target), heading_deg),
        .distance_m      = GeoMath::distance(m_observer, target, m_config.earth_radius_m),
        .found           = found,
    };
}

std::optional<ScreenPoint> EntityResolver::project(const geo::GeoPoint& target) const
{
    const auto direction = Projector::direction_vector(m_observer, target, m_config.earth_radius_m);
    return Projector::project_to_screen(direction, m_rotation, m_config.field_of_view(), m_screen);
}

} // namespace skyradar::scene
