// src/main.cpp - SkyRadar demo entry point
//
// Composes a few synthetic radar frames:
//  1. Load the landmark catalog and continent outlines
//  2. Place a few friends around an observer in Paris
//  3. Sweep the device heading around the compass
//  4. Log what each frame would draw

#include "astro/time_system.hpp"
#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"
#include "geo/geo_math.hpp"
#include "projection/projector.hpp"
#include "scene/display_format.hpp"
#include "scene/frame_composer.hpp"

#include <array>
#include <filesystem>
#include <vector>

#ifndef SKR_DATA_DIR
#define SKR_DATA_DIR "data"
#endif

using namespace skyradar;

int main()
{
    core::Logger::init({.log_file = "skyradar_demo.log"});
    SKR_INFO("SkyRadar demo starting");

    const std::filesystem::path data_dir{SKR_DATA_DIR};

    // -----------------------------------------------------------------
    // 1. Catalogs
    // -----------------------------------------------------------------
    auto landmarks = catalog::CatalogLoader::load_landmarks_csv(data_dir / "catalogs" / "landmarks.csv");
    if (!landmarks)
    {
        SKR_CRITICAL("Landmark catalog unavailable, aborting");
        core::Logger::shutdown();
        return 1;
    }

    auto continents = catalog::CatalogLoader::load_continents_csv(data_dir / "catalogs" / "continents.csv");
    if (!continents)
    {
        SKR_WARN("Continent outlines unavailable, continuing without them");
    }

    const scene::FrameComposer composer({}, std::move(*landmarks),
                                        continents ? std::move(*continents)
                                                   : std::vector<catalog::ContinentOutline>{});

    // -----------------------------------------------------------------
    // 2. Observer and roster: 2024-06-21 20:30 UTC, Paris
    // -----------------------------------------------------------------
    const f64 now_jd = astro::TimeSystem::to_julian_date({.year = 2024, .month = 6, .day = 21,
                                                          .hour = 20, .minute = 30, .second = 0.0});
    const geo::GeoPoint observer{48.8566, 2.3522};

    const std::array<scene::Friend, 3> friends{{
        {.id = "amelie", .display_name = "Amelie", .avatar_ref = std::nullopt,
         .location = scene::FriendLocation{{51.5072, -0.1276}, now_jd - 60.0 / 86400.0}},
        {.id = "marco", .display_name = "Marco", .avatar_ref = std::nullopt,
         .location = scene::FriendLocation{{41.9028, 12.4964}, now_jd - 30.0 / 86400.0}},
        {.id = "jun", .display_name = "Jun", .avatar_ref = std::nullopt,
         .location = scene::FriendLocation{{35.6762, 139.6503}, now_jd - 3600.0 / 86400.0}},
    }};

    // -----------------------------------------------------------------
    // 3. Sweep the heading
    // -----------------------------------------------------------------
    const ScreenSize screen{390.0, 844.0};

    for (const f64 heading : {0.0, 90.0, 180.0, 270.0})
    {
        const scene::FrameInputs inputs{
            .observer           = observer,
            .orientation        = projection::Projector::rotation_facing(heading, 0.0),
            .friends            = friends,
            .landmark_settings  = {},
            .now_jd             = now_jd,
            .utc_offset_minutes = 120,
            .screen             = screen,
            .target_friend_id   = "marco",
        };

        const auto frame = composer.compose(inputs);

        SKR_INFO("Heading {:.0f} ({}): {}, {} friends, {} clusters, {} stars, {} outline runs",
                 frame.heading_deg, geo::GeoMath::cardinal_direction(frame.heading_deg),
                 frame.is_daytime ? "day" : "night", frame.visible_friends.size(),
                 frame.landmark_clusters.size(), frame.night_stars.size(),
                 frame.continent_outlines.size());

        for (const auto& f : frame.visible_friends)
        {
            SKR_INFO("  friend {} at ({:.0f}, {:.0f}), {}", f.person.display_name,
                     f.screen.x, f.screen.y, scene::format_distance(f.distance_m));
        }

        for (const auto& cluster : frame.landmark_clusters)
        {
            SKR_INFO("  cluster {} ({} items) at ({:.0f}, {:.0f})", cluster.id(), cluster.total_count(),
                     cluster.anchor.x, cluster.anchor.y);
        }

        if (frame.target)
        {
            SKR_INFO("  target {}: arrow {:.0f} deg, {}", frame.target->friend_id,
                     frame.target->arrow_angle_deg, frame.target->found ? "found" : "searching");
        }
    }

    // -----------------------------------------------------------------
    // 4. Stale fixes are dropped from the radar but still labelled
    // -----------------------------------------------------------------
    const auto& stale = friends[2];
    const f64 age_s = (now_jd - stale.location->timestamp_jd) * astro_constants::kSecondsPerDay;
    SKR_INFO("{} hidden as stale: {}", stale.display_name, scene::last_seen_text(age_s));

    SKR_INFO("SkyRadar demo finished");
    core::Logger::shutdown();
    return 0;
}
