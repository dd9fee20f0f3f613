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

#include <algorithm>

#include <boost/graph/astar_search.hpp>
#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/graph_traits.hpp>
#include <boost/property_map/property_map.hpp>

#include "asserts.hpp"
#include "hex_pathfinding.hpp"
#include "preferences.hpp"
#include "profile_timer.hpp"
#include "spatial_grid.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		PREF_INT(path_search_node_limit, 1000, "Number of nodes a shortest-path search may discover before giving up");
		PREF_INT(range_search_max_depth, 20, "Deepest level the move-to-range search explores");
		PREF_INT(path_cache_size, 500, "Number of shortest paths kept in the pathfinding cache");
		PREF_INT(distance_cache_size, 500, "Number of effective distances and range searches kept in the pathfinding cache");
		PREF_INT(target_map_cache_size, 100, "Number of closest-target maps kept in the pathfinding cache");
		PREF_BOOL(pathfinding_cache, true, "Cache pathfinding results between board changes");

		struct found_goal {}; // exception for termination
		struct search_aborted {};
		struct stop_search {};

		// visitor that terminates when we find the goal, or once too many
		// nodes have been discovered.
		template<typename Vertex>
		class astar_goal_visitor : public boost::default_astar_visitor
		{
		public:
			astar_goal_visitor(Vertex goal, int limit, int* discovered) : goal_(goal), limit_(limit), discovered_(discovered) {}
			template<typename Graph> void discover_vertex(Vertex u, const Graph& g) {
				if(++*discovered_ > limit_) {
					throw search_aborted();
				}
			}
			template<typename Graph> void examine_vertex(Vertex u, const Graph& g) {
				if(u == goal_) {
					throw found_goal();
				}
			}
		private:
			Vertex goal_;
			int limit_;
			int* discovered_;
		};

		template <class Graph, class CostType>
		class astar_heuristic : public boost::astar_heuristic<Graph, CostType>
		{
		public:
			typedef typename boost::graph_traits<Graph>::vertex_descriptor Vertex;
			astar_heuristic(Vertex goal, const std::vector<Coordinate>& vertices)
				: goal_(vertices[goal]),
				  vertices_(vertices) {}
			CostType operator()(Vertex u) const
			{
				return static_cast<CostType>(vertices_[u].distance(goal_));
			}
		private:
			Coordinate goal_;
			const std::vector<Coordinate>& vertices_;
		};

		// Tracks the BFS level of each vertex and records which targets are
		// in range of the vertices discovered on the first successful level.
		class range_search_visitor : public boost::default_bfs_visitor
		{
		public:
			range_search_visitor(std::vector<int>* depth, const std::vector<Coordinate>* vertices,
				const std::vector<Coordinate>* targets, int range, int max_depth,
				int* found_depth, std::vector<bool>* reached)
				: depth_(depth), vertices_(vertices), targets_(targets), range_(range),
				  max_depth_(max_depth), found_depth_(found_depth), reached_(reached)
			{}

			template<typename Graph> void tree_edge(edge_descriptor e, const Graph& g) {
				(*depth_)[boost::target(e, g)] = (*depth_)[boost::source(e, g)] + 1;
			}

			template<typename Graph> void discover_vertex(vertex v, const Graph& g) {
				const int d = (*depth_)[v];
				for(size_t i = 0; i != targets_->size(); ++i) {
					if((*vertices_)[v].distance((*targets_)[i]) <= range_) {
						(*reached_)[i] = true;
						*found_depth_ = d;
					}
				}
			}

			template<typename Graph> void examine_vertex(vertex u, const Graph& g) {
				const int d = (*depth_)[u];
				if((*found_depth_ >= 0 && d >= *found_depth_) || d >= max_depth_) {
					throw stop_search();
				}
			}
		private:
			std::vector<int>* depth_;
			const std::vector<Coordinate>* vertices_;
			const std::vector<Coordinate>* targets_;
			int range_;
			int max_depth_;
			int* found_depth_;
			std::vector<bool>* reached_;
		};
	}

	bool default_traversable(const Tile& t)
	{
		return !is_blocked_state(t.state);
	}

	hex_graph_ptr create_graph(const SpatialGrid& grid, const traversable_fn& traversable)
	{
		profile::manager pman("create_graph");
		const auto& tiles = grid.getAllTiles();
		hex_graph_ptr graph = std::make_shared<graph_t>(tiles.size());
		graph->vertices.reserve(tiles.size());
		WeightMap weightmap = boost::get(boost::edge_weight, graph->graph);
		for(size_t u = 0; u != tiles.size(); ++u) {
			graph->vertices.emplace_back(tiles[u].coord);
			for(const auto& n : tiles[u].coord.getNeighbors()) {
				const Tile* t = grid.findTile(n);
				if(t == nullptr || !traversable(*t)) {
					continue;
				}
				edge_descriptor e;
				bool inserted;
				boost::tie(e, inserted) = boost::add_edge(u, grid.tileIndex(t->id()), graph->graph);
				weightmap[e] = 1;
			}
		}
		return graph;
	}

	PathfindingCache::PathfindingCache()
		: PathfindingCache(g_path_cache_size, g_distance_cache_size, g_target_map_cache_size)
	{
	}

	PathfindingCache::PathfindingCache(size_t path_size, size_t distance_size, size_t target_map_size)
		: paths_(path_size),
		  distances_(distance_size),
		  ranges_(distance_size),
		  target_maps_(target_map_size),
		  invalidations_(0)
	{
	}

	void PathfindingCache::invalidate()
	{
		paths_.clear();
		distances_.clear();
		ranges_.clear();
		target_maps_.clear();
		++invalidations_;
		LOG_DEBUG("pathfinding cache invalidated (" << invalidations_ << ")");
	}

	int PathfindingCache::hits() const
	{
		return paths_.hits() + distances_.hits() + ranges_.hits() + target_maps_.hits();
	}

	int PathfindingCache::misses() const
	{
		return paths_.misses() + distances_.misses() + ranges_.misses() + target_maps_.misses();
	}

	PathfindingEngine::PathfindingEngine()
		: PathfindingEngine(g_pathfinding_cache ? std::make_shared<PathfindingCache>() : PathfindingCachePtr())
	{
	}

	PathfindingEngine::PathfindingEngine(PathfindingCachePtr cache, traversable_fn traversable)
		: cache_(cache),
		  traversable_(traversable),
		  graph_fingerprint_(0),
		  graph_preset_(nullptr)
	{
	}

	void PathfindingEngine::invalidate()
	{
		graph_.reset();
		if(cache_) {
			cache_->invalidate();
		}
	}

	const graph_t& PathfindingEngine::getGraph(const SpatialGrid& grid)
	{
		const std::size_t fp = grid.fingerprint();
		if(!graph_ || graph_fingerprint_ != fp || graph_preset_ != &grid.getPreset()) {
			graph_ = create_graph(grid, traversable_);
			graph_fingerprint_ = fp;
			graph_preset_ = &grid.getPreset();
		}
		return *graph_;
	}

	boost::optional<result_path> PathfindingEngine::shortestPath(const SpatialGrid& grid, int start_id, int goal_id)
	{
		const int src = grid.tileIndex(start_id);
		ASSERT_LOG(src >= 0, "source tile " << start_id << " not on the board.");
		const int dst = grid.tileIndex(goal_id);
		ASSERT_LOG(dst >= 0, "destination tile " << goal_id << " not on the board.");

		PathfindingCache::PathKey key(start_id, goal_id, grid.fingerprint());
		if(cache_) {
			if(auto cached = cache_->paths().get(key)) {
				return *cached;
			}
		}

		const graph_t& graph = getGraph(grid);
		std::vector<vertex> p(boost::num_vertices(graph.graph));
		std::vector<cost> d(boost::num_vertices(graph.graph));
		int discovered = 0;
		boost::optional<result_path> res;
		try {
			boost::astar_search(graph.graph, src, astar_heuristic<hex_graph, cost>(dst, graph.vertices),
				boost::predecessor_map(boost::make_iterator_property_map(p.begin(), boost::get(boost::vertex_index, graph.graph))).
				distance_map(boost::make_iterator_property_map(d.begin(), boost::get(boost::vertex_index, graph.graph))).
				visitor(astar_goal_visitor<vertex>(dst, g_path_search_node_limit, &discovered)));
		} catch(found_goal&) {
			result_path shortest_path;
			for(vertex v = dst;; v = p[v]) {
				shortest_path.emplace_back(graph.vertices[v]);
				if(p[v] == v) {
					std::reverse(shortest_path.begin(), shortest_path.end());
					break;
				}
			}
			res = shortest_path;
		} catch(search_aborted&) {
			LOG_DEBUG("path search " << start_id << " -> " << goal_id << " aborted after " << discovered << " nodes");
		}

		if(cache_) {
			cache_->paths().put(key, res);
		}
		return res;
	}

	EffectiveDistance PathfindingEngine::effectiveDistance(const SpatialGrid& grid, int start_id, int goal_id, int range)
	{
		PathfindingCache::DistanceKey key(start_id, goal_id, range, grid.fingerprint());
		if(cache_) {
			if(auto cached = cache_->distances().get(key)) {
				return *cached;
			}
		}

		EffectiveDistance res;
		res.direct_distance = grid.getTileById(start_id).coord.distance(grid.getTileById(goal_id).coord);
		if(res.direct_distance <= range) {
			res.can_reach = true;
			res.movement = 0;
		} else {
			auto path = shortestPath(grid, start_id, goal_id);
			res.can_reach = path.is_initialized();
			res.movement = path ? std::max(0, static_cast<int>(path->size()) - 1 - range) : -1;
		}

		if(cache_) {
			cache_->distances().put(key, res);
		}
		return res;
	}

	boost::optional<RangeSearchResult> PathfindingEngine::minMovesToRange(const SpatialGrid& grid, int start_id, const std::vector<int>& targets, int range)
	{
		if(targets.empty()) {
			return boost::none;
		}

		const int src = grid.tileIndex(start_id);
		ASSERT_LOG(src >= 0, "source tile " << start_id << " not on the board.");

		PathfindingCache::RangeKey key(start_id, targets, range, grid.fingerprint());
		if(cache_) {
			if(auto cached = cache_->ranges().get(key)) {
				return *cached;
			}
		}

		std::vector<Coordinate> target_coords;
		for(int id : targets) {
			target_coords.push_back(grid.getTileById(id).coord);
		}

		const graph_t& graph = getGraph(grid);
		std::vector<int> depth(boost::num_vertices(graph.graph), 0);
		std::vector<bool> reached(targets.size(), false);
		int found_depth = -1;
		try {
			boost::breadth_first_search(graph.graph, src,
				boost::visitor(range_search_visitor(&depth, &graph.vertices, &target_coords, range,
					g_range_search_max_depth, &found_depth, &reached)));
		} catch(stop_search&) {
			// the visitor ends the search once the first successful level is complete.
		}

		boost::optional<RangeSearchResult> res;
		if(found_depth >= 0) {
			RangeSearchResult r;
			r.movement = found_depth;
			for(size_t i = 0; i != targets.size(); ++i) {
				if(reached[i] && std::find(r.targets.begin(), r.targets.end(), targets[i]) == r.targets.end()) {
					r.targets.push_back(targets[i]);
				}
			}
			res = r;
		} else {
			LOG_DEBUG("no target within range " << range << " of tile " << start_id << " in " << g_range_search_max_depth << " moves");
		}

		if(cache_) {
			cache_->ranges().put(key, res);
		}
		return res;
	}
}

namespace
{
	hex::SpatialGrid make_arena_grid(int arena)
	{
		return hex::SpatialGrid(hex::BoardPreset::builtin("full", arena));
	}
}

UNIT_TEST(lru_cache_eviction)
{
	LruCache<int, int> cache(2);
	cache.put(1, 10);
	cache.put(2, 20);
	CHECK_EQ(*cache.get(1), 10);
	cache.put(3, 30);
	CHECK(cache.get(2) == nullptr, "least recently used entry was evicted");
	CHECK_EQ(*cache.get(1), 10);
	CHECK_EQ(*cache.get(3), 30);
	CHECK_EQ(cache.size(), 2U);
	CHECK_EQ(cache.hits(), 3);
	CHECK_EQ(cache.misses(), 1);

	LruCache<int, int> disabled(0);
	disabled.put(1, 1);
	CHECK(disabled.get(1) == nullptr, "zero capacity stores nothing");
}

UNIT_TEST(pathfinding_path_length_matches_bfs)
{
	preferences::setting_scope depth_scope("range_search_max_depth", "100");
	hex::SpatialGrid grid = make_arena_grid(2);
	hex::PathfindingEngine engine(nullptr);
	for(const hex::Tile& a : grid.getAllTiles()) {
		for(const hex::Tile& b : grid.getAllTiles()) {
			auto path = engine.shortestPath(grid, a.id(), b.id());
			auto moves = engine.minMovesToRange(grid, a.id(), std::vector<int>(1, b.id()), 0);
			CHECK_EQ(path.is_initialized(), moves.is_initialized());
			if(path) {
				CHECK_EQ(static_cast<int>(path->size()), moves->movement + 1);
				CHECK_EQ(path->front(), a.coord);
				CHECK_EQ(path->back(), b.coord);
				for(size_t n = 1; n < path->size(); ++n) {
					CHECK_EQ((*path)[n - 1].distance((*path)[n]), 1);
					CHECK(hex::default_traversable(grid.getTile((*path)[n])), "path enters a blocked tile at " << (*path)[n]);
				}
			}
		}
	}
}

UNIT_TEST(pathfinding_blocked_goal_is_unreachable)
{
	hex::SpatialGrid grid = make_arena_grid(2);
	hex::PathfindingEngine engine(nullptr);
	CHECK_EQ(grid.getTileById(9).state, hex::TileState::BLOCKED);
	CHECK(!engine.shortestPath(grid, 1, 9), "blocked goal");
	CHECK_EQ(engine.shortestPath(grid, 9, 6)->size(), 2U);
	CHECK_EQ(engine.shortestPath(grid, 1, 1)->size(), 1U);

	auto d = engine.effectiveDistance(grid, 1, 9, 1);
	CHECK(!d.can_reach, "blocked goal out of range");
	d = engine.effectiveDistance(grid, 1, 9, 10);
	CHECK(d.can_reach, "within direct range");
	CHECK_EQ(d.movement, 0);
}

UNIT_TEST(pathfinding_min_moves_scenario)
{
	hex::SpatialGrid grid = make_arena_grid(1);
	CHECK(grid.placeUnit(9, hex::UnitId(1), hex::Team::ALLY), "place source");
	CHECK(grid.placeUnit(33, hex::UnitId(2), hex::Team::ENEMY), "place target");
	CHECK(grid.placeUnit(37, hex::UnitId(3), hex::Team::ENEMY), "place target");
	hex::PathfindingEngine engine;

	std::vector<int> targets;
	targets.push_back(33);
	targets.push_back(37);
	auto r = engine.minMovesToRange(grid, 9, targets, 2);
	CHECK(r, "targets reachable");
	CHECK_EQ(r->movement, 2);
	CHECK_EQ(r->targets.size(), 2U);
	CHECK_EQ(r->targets[0], 33);
	CHECK_EQ(r->targets[1], 37);

	CHECK_EQ(engine.minMovesToRange(grid, 9, targets, 1)->movement, 3);
	CHECK_EQ(engine.minMovesToRange(grid, 9, targets, 4)->movement, 0);
	CHECK(!engine.minMovesToRange(grid, 9, std::vector<int>(), 1), "no targets");

	auto d = engine.effectiveDistance(grid, 9, 33, 2);
	CHECK(d.can_reach, "reachable");
	CHECK_EQ(d.direct_distance, 4);
	CHECK_EQ(d.movement, 2);
}

UNIT_TEST(pathfinding_node_limit_aborts)
{
	hex::SpatialGrid grid = make_arena_grid(1);
	hex::PathfindingEngine engine(nullptr);
	{
		preferences::setting_scope limit_scope("path_search_node_limit", "3");
		CHECK(!engine.shortestPath(grid, 1, 45), "search must give up");
	}
	preferences::setting_scope limit_scope("path_search_node_limit", "10");
	CHECK_EQ(engine.shortestPath(grid, 1, 6)->size(), 2U);
}

UNIT_TEST(pathfinding_cache_keys_on_board_state)
{
	hex::SpatialGrid grid = make_arena_grid(1);
	auto cache = std::make_shared<hex::PathfindingCache>(10, 10, 10);
	hex::PathfindingEngine engine(cache);
	engine.shortestPath(grid, 1, 45);
	CHECK_EQ(cache->paths().misses(), 1);
	engine.shortestPath(grid, 1, 45);
	CHECK_EQ(cache->paths().hits(), 1);

	CHECK(grid.placeUnit(2, hex::UnitId(4), hex::Team::ALLY), "place");
	engine.shortestPath(grid, 1, 45);
	CHECK_EQ(cache->paths().misses(), 2);

	engine.invalidate();
	CHECK_EQ(cache->paths().size(), 0U);
	CHECK_EQ(cache->invalidations(), 1);

	CHECK(grid.setOccupancyState(23, static_cast<int>(hex::TileState::BLOCKED)), "block");
	hex::PathfindingEngine uncached(nullptr);
	CHECK_EQ(engine.shortestPath(grid, 1, 45)->size(), uncached.shortestPath(grid, 1, 45)->size());
}

BENCHMARK(pathfinding_shortest_path)
{
	hex::SpatialGrid grid = make_arena_grid(2);
	hex::PathfindingEngine engine(nullptr);
	BENCHMARK_LOOP {
		engine.shortestPath(grid, 1, 45);
	}
}

BENCHMARK(pathfinding_min_moves_to_range)
{
	hex::SpatialGrid grid = make_arena_grid(1);
	hex::PathfindingEngine engine(nullptr);
	std::vector<int> targets;
	targets.push_back(40);
	targets.push_back(45);
	BENCHMARK_LOOP {
		engine.minMovesToRange(grid, 1, targets, 1);
	}
}
