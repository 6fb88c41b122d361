/// @file clustering.cpp
/// @brief Implementation of greedy overlap clustering.

#include "scene/clustering.hpp"

#include <glm/geometric.hpp>

#include <algorithm>

namespace skyradar::scene
{

namespace
{

template <typename Range, typename Key>
std::string join_sorted(const Range& items, Key key)
{
    std::vector<std::string> ids;
    ids.reserve(items.size());
    for (const auto& item : items)
    {
        ids.push_back(key(item));
    }
    std::sort(ids.begin(), ids.end());

    std::string joined;
    for (std::size_t i = 0; i < ids.size(); ++i)
    {
        if (i > 0)
        {
            joined += '-';
        }
        joined += ids[i];
    }
    return joined;
}

} // anonymous namespace

std::string EntityCluster::id() const
{
    std::string result = join_sorted(landmarks, [](const ResolvedLandmark& l) { return l.landmark.id; });

    if (!friends.empty())
    {
        result += '+';
        result += join_sorted(friends, [](const ResolvedFriend& f) { return f.person.id; });
    }
    return result;
}

std::vector<EntityCluster> cluster_landmarks(
    std::span<const ResolvedLandmark> landmarks,
    std::span<const ResolvedFriend> friends,
    f64 threshold_px)
{
    std::vector<EntityCluster> clusters;
    if (landmarks.empty())
    {
        return clusters;
    }

    std::vector<bool> landmark_taken(landmarks.size(), false);
    std::vector<bool> friend_taken(friends.size(), false);

    for (std::size_t seed = 0; seed < landmarks.size(); ++seed)
    {
        if (landmark_taken[seed])
        {
            continue;
        }

        EntityCluster cluster;
        cluster.anchor = landmarks[seed].screen;
        cluster.landmarks.push_back(landmarks[seed]);
        landmark_taken[seed] = true;

        for (std::size_t other = seed + 1; other < landmarks.size(); ++other)
        {
            if (!landmark_taken[other] &&
                glm::distance(cluster.anchor, landmarks[other].screen) < threshold_px)
            {
                cluster.landmarks.push_back(landmarks[other]);
                landmark_taken[other] = true;
            }
        }

        for (std::size_t f = 0; f < friends.size(); ++f)
        {
            if (!friend_taken[f] &&
                glm::distance(cluster.anchor, friends[f].screen) < threshold_px)
            {
                cluster.friends.push_back(friends[f]);
                friend_taken[f] = true;
            }
        }

        std::stable_sort(cluster.landmarks.begin(), cluster.landmarks.end(),
                         [](const ResolvedLandmark& a, const ResolvedLandmark& b) {
                             return a.distance_m < b.distance_m;
                         });

        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

std::unordered_set<std::string> clustered_friend_ids(std::span<const EntityCluster> clusters)
{
    std::unordered_set<std::string> ids;
    for (const auto& cluster : clusters)
    {
        for (const auto& f : cluster.friends)
        {
            ids.insert(f.person.id);
        }
    }
    return ids;
}

} // namespace skyradar::scene
