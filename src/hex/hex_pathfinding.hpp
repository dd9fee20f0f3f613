/*
	Copyright (C) 2003-2013 by Kristina Simpson <sweet.kristas@gmail.com>
	
	This software is provided 'as-is', without any express or implied
	warranty. In no event will the authors be held liable for any damages
	arising from the use of this software.

	Permission is granted to anyone to use this software for any purpose,
	including commercial applications, and to alter it and redistribute it
	freely, subject to the following restrictions:

	   1. The origin of this software must not be misrepresented; you must not
	   claim that you wrote the original software. If you use this software
	   in a product, an acknowledgement in the product documentation would be
	   appreciated but is not required.

	   2. Altered source versions must be plainly marked as such, and must not be
	   misrepresented as being the original software.

	   3. This notice may not be removed or altered from any source
	   distribution.
*/

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <boost/graph/adjacency_list.hpp>
#include <boost/optional.hpp>

#include "hex_coord.hpp"
#include "hex_fwd.hpp"
#include "lru_cache.hpp"

namespace hex
{
	typedef int cost;
	typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS, boost::no_property, boost::property<boost::edge_weight_t, cost>> hex_graph;
	typedef boost::property_map<hex_graph, boost::edge_weight_t>::type WeightMap;
	typedef hex_graph::vertex_descriptor vertex;
	typedef hex_graph::edge_descriptor edge_descriptor;

	// Vertex i of the graph is tile i of the grid. An edge u->v exists iff
	// v is traversable, so a search may leave a blocked start tile but never
	// enter a blocked tile.
	struct graph_t
	{
		explicit graph_t(size_t size) : graph(size) {}
		hex_graph graph;
		std::vector<Coordinate> vertices;
	};
	typedef std::shared_ptr<graph_t> hex_graph_ptr;

	typedef std::vector<Coordinate> result_path;
	typedef std::function<bool (const Tile&)> traversable_fn;

	bool default_traversable(const Tile& t);
	hex_graph_ptr create_graph(const SpatialGrid& grid, const traversable_fn& traversable);

	struct EffectiveDistance
	{
		bool can_reach;
		// Moves needed before the goal is within range.
		int movement;
		int direct_distance;
	};

	struct RangeSearchResult
	{
		int movement;
		// Board-position ids, in the order the targets were given.
		std::vector<int> targets;
	};

	struct ClosestTarget
	{
		int tile_id;
		int movement;
	};
	// Keyed by the source unit's tile id.
	typedef std::map<int, ClosestTarget> ClosestTargetMap;

	// Memoized search results. Every key carries the board fingerprint, and
	// the transaction layer clears everything after each mutation.
	class PathfindingCache
	{
	public:
		typedef std::tuple<int, int, std::size_t> PathKey;
		typedef std::tuple<int, int, int, std::size_t> DistanceKey;
		typedef std::tuple<int, std::vector<int>, int, std::size_t> RangeKey;

		PathfindingCache();
		PathfindingCache(size_t path_size, size_t distance_size, size_t target_map_size);

		LruCache<PathKey, boost::optional<result_path>>& paths() { return paths_; }
		LruCache<DistanceKey, EffectiveDistance>& distances() { return distances_; }
		LruCache<RangeKey, boost::optional<RangeSearchResult>>& ranges() { return ranges_; }
		LruCache<std::string, ClosestTargetMap>& targetMaps() { return target_maps_; }

		void invalidate();
		int invalidations() const { return invalidations_; }
		int hits() const;
		int misses() const;
	private:
		LruCache<PathKey, boost::optional<result_path>> paths_;
		LruCache<DistanceKey, EffectiveDistance> distances_;
		LruCache<RangeKey, boost::optional<RangeSearchResult>> ranges_;
		LruCache<std::string, ClosestTargetMap> target_maps_;
		int invalidations_;
	};

	class PathfindingEngine
	{
	public:
		// Builds its own cache unless pathfinding_cache is turned off.
		PathfindingEngine();
		// A null cache disables caching.
		explicit PathfindingEngine(PathfindingCachePtr cache, traversable_fn traversable=default_traversable);

		PathfindingCachePtr getCache() const { return cache_; }
		void invalidate();

		// The tiles from start to goal inclusive, or none if unreachable or
		// if the search exceeds path_search_node_limit.
		boost::optional<result_path> shortestPath(const SpatialGrid& grid, int start_id, int goal_id);

		EffectiveDistance effectiveDistance(const SpatialGrid& grid, int start_id, int goal_id, int range);

		// Fewest moves after which some target is within range, and every
		// target reachable at that depth.
		boost::optional<RangeSearchResult> minMovesToRange(const SpatialGrid& grid, int start_id, const std::vector<int>& targets, int range);
	private:
		const graph_t& getGraph(const SpatialGrid& grid);

		PathfindingCachePtr cache_;
		traversable_fn traversable_;
		hex_graph_ptr graph_;
		std::size_t graph_fingerprint_;
		const BoardPreset* graph_preset_;
	};
}
