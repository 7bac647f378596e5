//
// HexPathfinder.h - Obstacle-aware shortest paths and reachability on the hex lattice
//

#ifndef HEXNAV_HEXPATHFINDER_H
#define HEXNAV_HEXPATHFINDER_H

#include "HexCoord.h"
#include <optional>
#include <vector>

// Limits for breadth-first expansion
struct SearchLimits
{
    int maxDistance = -1; // Stop expanding past this many steps (-1 = unbounded)
};

// Both searches treat every hex in `obstacles` as impassable, use unit step
// cost between the six neighbors, and never reopen a finalized hex.
//
// The lattice is infinite, so each search is confined to a disk around the
// start that reaches two rings past the farthest goal or obstacle. Every hex
// outside that disk is free and connected, which keeps reachability and path
// length unchanged while guaranteeing termination.
class HexPathfinder
{
public:
    // A* from start to goal with Distance(hex, goal) as the heuristic.
    // Returns std::nullopt when the goal cannot be reached (including a goal
    // that is itself an obstacle) and {start} when start == goal.
    [[nodiscard]] static std::optional<std::vector<HexCoord>> FindPath(
        const HexCoord& start,
        const HexCoord& goal,
        const HexSet& obstacles
    );

    // Breadth-first search from start. Maps every discovered hex to its step
    // distance. Stops once all goals have been dequeued or the frontier is
    // exhausted. An empty goal set explores the whole search region.
    [[nodiscard]] static HexDistanceMap BreadthFirst(
        const HexCoord& start,
        const HexSet& goals,
        const HexSet& obstacles,
        const SearchLimits& limits = {}
    );

    // Every hex reachable from start in at most `steps` moves
    [[nodiscard]] static HexDistanceMap ReachableWithin(
        const HexCoord& start,
        int steps,
        const HexSet& obstacles
    );

    // Number of steps along a path (0 for a single hex)
    [[nodiscard]] static int PathCost(const std::vector<HexCoord>& path);

private:
    // Radius of the disk around start that bounds a search
    static int SearchRadius(
        const HexCoord& start,
        const HexSet& targets,
        const HexSet& obstacles
    );

    static std::vector<HexCoord> ReconstructPath(
        const HexCoord& start,
        const HexCoord& goal,
        const std::unordered_map<HexCoord, HexCoord, HexCoordHash>& cameFrom
    );
};

#endif // HEXNAV_HEXPATHFINDER_H
