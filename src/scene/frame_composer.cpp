/// @file frame_composer.cpp
/// @brief Implementation of per-frame scene composition.

#include "scene/frame_composer.hpp"

#include "astro/lunar_position.hpp"
#include "astro/solar_position.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "projection/horizon.hpp"
#include "projection/projector.hpp"
#include "scene/entity_resolver.hpp"

#include <algorithm>
#include <utility>

namespace skyradar::scene
{

using projection::Horizon;
using projection::Projector;

FrameComposer::FrameComposer(RadarConfig config,
                             std::vector<catalog::Landmark> landmarks,
                             std::vector<catalog::ContinentOutline> continents)
    : m_config(config)
    , m_landmarks(std::move(landmarks))
    , m_continents(std::move(continents))
    , m_star_table(config.star_count, config.star_seed)
{
    SKR_CORE_INFO("FrameComposer: {} landmarks, {} continent outlines, {} stars",
                  m_landmarks.size(), m_continents.size(), m_star_table.stars().size());
}

Scene FrameComposer::compose(const FrameInputs& inputs) const
{
    Scene scene;

    scene.is_daytime = is_daytime(inputs);
    scene.moon_phase = astro::LunarPosition::moon_phase(inputs.now_jd);
    if (scene.moon_phase)
    {
        scene.moon_phase_id = astro::LunarPosition::phase_id(*scene.moon_phase);
    }

    const auto fov = m_config.field_of_view();

    // Ephemerides need a location; screen placement additionally needs an attitude
    if (inputs.observer)
    {
        const auto& obs = *inputs.observer;
        const auto sun = astro::SolarPosition::sun_position(inputs.now_jd, obs.latitude_deg, obs.longitude_deg);
        const auto moon = astro::LunarPosition::moon_position(inputs.now_jd, obs.latitude_deg, obs.longitude_deg);

        scene.sun = ResolvedBody{.position = sun, .screen = std::nullopt};
        scene.moon = ResolvedBody{.position = moon, .screen = std::nullopt};
    }

    if (!inputs.orientation)
    {
        SKR_CORE_TRACE("FrameComposer: no orientation yet, nothing projected");
        return scene;
    }

    const auto& rotation = *inputs.orientation;
    const auto& screen = inputs.screen;

    scene.heading_deg = Projector::heading_from_rotation_matrix(rotation);
    scene.horizon_polyline = Horizon::horizon_screen_points(rotation, fov, screen, m_config.horizon_step_deg);
    scene.earth_region = Horizon::earth_region(rotation, fov, screen, m_config.horizon_bisection_iterations);

    if (!scene.is_daytime)
    {
        place_night_stars(scene, rotation, screen);
    }

    if (!inputs.observer)
    {
        SKR_CORE_TRACE("FrameComposer: no location yet, heading {:.1f}", scene.heading_deg);
        return scene;
    }

    const EntityResolver resolver(m_config, *inputs.observer, rotation, screen);

    scene.sun = resolver.resolve_celestial(scene.sun->position);
    scene.moon = resolver.resolve_celestial(scene.moon->position);

    for (const auto& person : inputs.friends)
    {
        if (auto resolved = resolver.resolve_friend(person, inputs.now_jd))
        {
            scene.visible_friends.push_back(std::move(*resolved));
        }
    }

    std::vector<ResolvedLandmark> landmarks;
    for (const auto& landmark : m_landmarks)
    {
        if (auto resolved = resolver.resolve_landmark(landmark, inputs.landmark_settings))
        {
            landmarks.push_back(std::move(*resolved));
        }
    }

    scene.landmark_clusters = cluster_landmarks(landmarks, scene.visible_friends, m_config.cluster_threshold_px);

    if (inputs.target_friend_id)
    {
        const auto it = std::find_if(inputs.friends.begin(), inputs.friends.end(),
                                     [&](const Friend& f) { return f.id == *inputs.target_friend_id; });
        if (it != inputs.friends.end())
        {
            scene.target = resolver.resolve_target(*it, scene.heading_deg);
        }
    }

    place_continents(scene, *inputs.observer, rotation, screen);

    SKR_CORE_TRACE("FrameComposer: heading {:.1f}, {} friends, {} clusters, {} horizon points, {}",
                   scene.heading_deg, scene.visible_friends.size(), scene.landmark_clusters.size(),
                   scene.horizon_polyline.size(), scene.is_daytime ? "day" : "night");

    return scene;
}

// -----------------------------------------------------------------
// Day/night
//
// Civil twilight from the solar elevation when the location is known,
// otherwise the fixed local-clock window.
// -----------------------------------------------------------------

bool FrameComposer::is_daytime(const FrameInputs& inputs) const
{
    if (inputs.observer)
    {
        return astro::SolarPosition::is_daytime(inputs.now_jd,
                                                inputs.observer->latitude_deg,
                                                inputs.observer->longitude_deg,
                                                m_config.civil_twilight_deg);
    }

    const f64 local_hour = astro::TimeSystem::local_hours(inputs.now_jd, inputs.utc_offset_minutes);
    return astro::SolarPosition::is_daytime_by_clock(local_hour, m_config.day_start_hour, m_config.day_end_hour);
}

void FrameComposer::place_night_stars(Scene& scene, const RotationMatrix& rotation, const ScreenSize& screen) const
{
    const auto fov = m_config.field_of_view();

    for (const auto& star : m_star_table.stars())
    {
        const ScreenPoint point{star.x * screen.width, star.y * screen.height};
        if (Horizon::is_earth_at(point, rotation, fov, screen))
        {
            continue;
        }
        scene.night_stars.push_back(NightStar{.screen = point, .radius = star.radius, .opacity = star.opacity});
    }
}

// -----------------------------------------------------------------
// Continent outlines
//
// Each vertex goes through the same chord direction as friends and
// landmarks; a vertex behind the device ends the current run.
// -----------------------------------------------------------------

void FrameComposer::place_continents(Scene& scene, const geo::GeoPoint& observer,
                                     const RotationMatrix& rotation, const ScreenSize& screen) const
{
    const auto fov = m_config.field_of_view();

    for (const auto& outline : m_continents)
    {
        std::vector<ScreenPoint> run;
        for (const auto& vertex : outline.vertices)
        {
            const auto dir = Projector::direction_vector(observer, vertex, m_config.earth_radius_m);
            if (const auto point = Projector::project_to_screen(dir, rotation, fov, screen))
            {
                run.push_back(*point);
                continue;
            }

            if (run.size() >= 2)
            {
                scene.continent_outlines.push_back(std::move(run));
            }
            run.clear();
        }

        if (run.size() >= 2)
        {
            scene.continent_outlines.push_back(std::move(run));
        }
    }
}

} // namespace skyradar::scene
