//
// HexPathfinder.cpp - A* and breadth-first search implementation
//

#include "HexPathfinder.h"
#include "HexMath.h"
#include "HexValidation.h"
#include <algorithm>
#include <functional>
#include <queue>
#include <tuple>

#include <SDL3/SDL_log.h>
#include <tracy/Tracy.hpp>

std::optional<std::vector<HexCoord>> HexPathfinder::FindPath(
    const HexCoord& start,
    const HexCoord& goal,
    const HexSet& obstacles)
{
    ZoneScoped;
    HexValidation::RequireValid(start, "HexPathfinder::FindPath");
    HexValidation::RequireValid(goal, "HexPathfinder::FindPath");

    if (obstacles.count(goal))
    {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FindPath: goal %s is an obstacle",
                     goal.ToString().c_str());
        return std::nullopt;
    }

    if (start == goal)
    {
        return std::vector<HexCoord>{start};
    }

    const int radius = SearchRadius(start, HexSet{goal}, obstacles);

    // Priority queue: (cost so far + heuristic, cost so far, coord).
    // Equal estimates pop the cheaper-so-far hex first.
    using QueueItem = std::tuple<int, int, HexCoord>;
    std::priority_queue<QueueItem, std::vector<QueueItem>, std::greater<>> frontier;

    std::unordered_map<HexCoord, int, HexCoordHash> costSoFar;
    std::unordered_map<HexCoord, HexCoord, HexCoordHash> cameFrom;
    HexSet closed;

    frontier.push({HexMath::Distance(start, goal), 0, start});
    costSoFar[start] = 0;

    while (!frontier.empty())
    {
        [[maybe_unused]] auto [estimate, cost, current] = frontier.top();
        frontier.pop();

        // Stale entry for a hex that was already finalized
        if (!closed.insert(current).second) continue;

        if (current == goal)
        {
            return ReconstructPath(start, goal, cameFrom);
        }

        for (const auto& direction : HEX_DIRECTIONS)
        {
            const HexCoord next = current + direction;
            if (obstacles.count(next) || closed.count(next)) continue;
            if (HexMath::Distance(start, next) > radius) continue;

            const int newCost = cost + 1;
            auto it = costSoFar.find(next);
            if (it != costSoFar.end() && it->second <= newCost) continue;

            costSoFar[next] = newCost;
            cameFrom[next] = current;
            frontier.push({newCost + HexMath::Distance(next, goal), newCost, next});
        }
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FindPath: no path from %s to %s (%zu hexes explored)",
                 start.ToString().c_str(), goal.ToString().c_str(), closed.size());
    return std::nullopt;
}

HexDistanceMap HexPathfinder::BreadthFirst(
    const HexCoord& start,
    const HexSet& goals,
    const HexSet& obstacles,
    const SearchLimits& limits)
{
    ZoneScoped;
    HexValidation::RequireValid(start, "HexPathfinder::BreadthFirst");
    if (limits.maxDistance != -1)
    {
        HexValidation::RequireNonNegative(limits.maxDistance, "maxDistance", "HexPathfinder::BreadthFirst");
    }

    const bool limited = limits.maxDistance >= 0;
    const int radius = limited ? limits.maxDistance : SearchRadius(start, goals, obstacles);

    HexDistanceMap distance;
    std::queue<HexCoord> frontier;

    distance[start] = 0;
    frontier.push(start);

    size_t goalsRemaining = goals.size();

    while (!frontier.empty())
    {
        HexCoord current = frontier.front();
        frontier.pop();

        if (goals.count(current))
        {
            if (--goalsRemaining == 0) break;
        }

        const int currentDistance = distance[current];
        if (limited && currentDistance >= limits.maxDistance) continue;

        for (const auto& direction : HEX_DIRECTIONS)
        {
            const HexCoord next = current + direction;
            if (obstacles.count(next) || distance.count(next)) continue;
            if (HexMath::Distance(start, next) > radius) continue;

            distance[next] = currentDistance + 1;
            frontier.push(next);
        }
    }

    return distance;
}

HexDistanceMap HexPathfinder::ReachableWithin(
    const HexCoord& start,
    int steps,
    const HexSet& obstacles)
{
    HexValidation::RequireNonNegative(steps, "step count", "HexPathfinder::ReachableWithin");
    return BreadthFirst(start, {}, obstacles, {.maxDistance = steps});
}

int HexPathfinder::PathCost(const std::vector<HexCoord>& path)
{
    return path.empty() ? 0 : static_cast<int>(path.size()) - 1;
}

int HexPathfinder::SearchRadius(
    const HexCoord& start,
    const HexSet& targets,
    const HexSet& obstacles)
{
    int farthest = 0;
    for (const auto& target : targets)
    {
        farthest = std::max(farthest, HexMath::Distance(start, target));
    }
    for (const auto& obstacle : obstacles)
    {
        farthest = std::max(farthest, HexMath::Distance(start, obstacle));
    }
    return farthest + 2;
}

std::vector<HexCoord> HexPathfinder::ReconstructPath(
    const HexCoord& start,
    const HexCoord& goal,
    const std::unordered_map<HexCoord, HexCoord, HexCoordHash>& cameFrom)
{
    std::vector<HexCoord> path;
    HexCoord current = goal;
    while (current != start)
    {
        path.push_back(current);
        current = cameFrom.at(current);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());
    return path;
}
