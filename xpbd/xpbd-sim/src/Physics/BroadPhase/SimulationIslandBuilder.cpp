#include "xpbd-sim/src/Physics/BroadPhase/SimulationIslandBuilder.hpp"

#include <limits>
#include <numeric>

namespace xpbd_sim
{

// ============================================================================
// Union-Find (Disjoint Set Union) helper
// ============================================================================

namespace
{

class UnionFind
{
public:
  explicit UnionFind(size_t n) : parent_(n), rank_(n, 0)
  {
    std::iota(parent_.begin(), parent_.end(), size_t{0});
  }

  size_t find(size_t x)
  {
    if (parent_[x] != x)
    {
      parent_[x] = find(parent_[x]);  // Path compression
    }
    return parent_[x];
  }

  void unite(size_t a, size_t b)
  {
    size_t const ra = find(a);
    size_t const rb = find(b);
    if (ra == rb)
    {
      return;
    }

    if (rank_[ra] < rank_[rb])
    {
      parent_[ra] = rb;
    }
    else if (rank_[ra] > rank_[rb])
    {
      parent_[rb] = ra;
    }
    else
    {
      parent_[rb] = ra;
      ++rank_[ra];
    }
  }

private:
  std::vector<size_t> parent_;
  std::vector<size_t> rank_;
};

}  // anonymous namespace

// ============================================================================
// SimulationIslandBuilder::buildIslands
// ============================================================================

std::vector<SimulationIslandBuilder::Island>
SimulationIslandBuilder::buildIslands(const std::vector<Body>& bodies,
                                      const std::vector<BodyPair>& pairs,
                                      const std::vector<Constraint>& constraints)
{
  size_t const n = bodies.size();
  UnionFind uf{n};

  auto joinIfDynamic = [&](size_t a, size_t b)
  {
    if (a < n && b < n && !bodies[a].isFixed() && !bodies[b].isFixed())
    {
      uf.unite(a, b);
    }
  };

  for (const auto& pair : pairs)
  {
    joinIfDynamic(pair.first, pair.second);
  }
  for (const auto& constraint : constraints)
  {
    joinIfDynamic(constraint.bodyAIndex(), constraint.bodyBIndex());
  }

  // Walk bodies in index order so islands come out sorted
  constexpr size_t kNoIsland = std::numeric_limits<size_t>::max();
  std::vector<size_t> islandOfRoot(n, kNoIsland);
  std::vector<Island> islands;

  for (size_t i = 0; i < n; ++i)
  {
    if (bodies[i].isFixed())
    {
      continue;
    }

    size_t const root = uf.find(i);
    if (islandOfRoot[root] == kNoIsland)
    {
      islandOfRoot[root] = islands.size();
      islands.emplace_back();
    }
    islands[islandOfRoot[root]].bodyIndices.push_back(i);
  }

  return islands;
}

}  // namespace xpbd_sim
