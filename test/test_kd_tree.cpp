#include <catch2/catch.hpp>
#include <random>
#include <algorithm>

#include "kd_tree.h"
#include "cell_grid.h"
#include "test_helpers.h"

static void RandomPositions(vector <MEGAxyz> &x, int n, MEGAReal boxsize, unsigned seed)
{
  mt19937 rng(seed);
  uniform_real_distribution<double> uniform(0., boxsize);
  x.resize(n);
  for(auto &&p: x)
	for(int k=0;k<3;k++)
	  p[k]=uniform(rng);
}

static vector <MEGAInt> BruteForce(const vector <MEGAxyz> &x, const MEGAxyz &center, MEGAReal radius, bool periodic)
{
  vector <MEGAInt> found;
  for(MEGAInt i=0;i<(MEGAInt)x.size();i++)
  {
	MEGAReal d2=0., r2=radius*radius;
	for(int k=0;k<3;k++)
	{
	  MEGAReal d=x[i][k]-center[k];
	  if(periodic) d=NEAREST(d);
	  d2+=d*d;
	}
	if(d2<=r2) found.push_back(i);
  }
  return found;
}

static vector <MEGAInt> TreeSearch(const KDTree_t &tree, const MEGAxyz &center, MEGAReal radius)
{
  IndexCollector_t collector;
  tree.Search(center, radius, collector);
  sort(collector.Indices.begin(), collector.Indices.end());
  return collector.Indices;
}

TEST_CASE("radius search agrees with brute force", "[kdtree]")
{
  const MEGAReal boxsize=10.;
  bool periodic=GENERATE(false, true);
  ResetTestConfig(boxsize, periodic);
  vector <MEGAxyz> x;
  RandomPositions(x, 2000, boxsize, 42);
  VectorPos_t data(x);
  KDTree_t tree(8);
  tree.Build(data);
  REQUIRE(tree.size()==2000);

  vector <MEGAxyz> centers;
  RandomPositions(centers, 50, boxsize, 7);
  MEGAxyz corner={{0.1, 9.95, 0.05}};//wraps on every axis when periodic
  centers.push_back(corner);
  for(auto &&c: centers)
	for(MEGAReal radius: {0.3, 1.0, 2.5})
	  CHECK(TreeSearch(tree, c, radius)==BruteForce(x, c, radius, periodic));
}

TEST_CASE("the search radius is inclusive", "[kdtree]")
{
  ResetTestConfig(100., false);
  vector <MEGAxyz> x(2);
  x[0]={{1., 1., 1.}};
  x[1]={{1.5, 1., 1.}};
  VectorPos_t data(x);
  KDTree_t tree;
  tree.Build(data);
  CHECK(TreeSearch(tree, x[0], 0.5).size()==2);
  CHECK(TreeSearch(tree, x[0], 0.49).size()==1);
}

TEST_CASE("nearest neighbour", "[kdtree]")
{
  ResetTestConfig(10., true);
  vector <MEGAxyz> x;
  RandomPositions(x, 500, 10., 3);
  VectorPos_t data(x);
  KDTree_t tree;
  tree.Build(data);
  MEGAxyz center={{9.99, 0.01, 5.}};
  MEGAReal d2;
  MEGAInt nearest=tree.NearestNeighbour(center, d2);
  REQUIRE(nearest>=0);
  for(auto &&p: x)
	CHECK(PeriodicDistance(p, center)>=sqrt(d2)*(1-1e-5));

  KDTree_t empty;
  vector <MEGAxyz> none;
  VectorPos_t nodata(none);
  empty.Build(nodata);
  CHECK(empty.NearestNeighbour(center, d2)==-1);
}

struct NeighbourRecorder_t
{
  vector <MEGAInt> Order;
  vector <vector <MEGAInt> > Neighbours;
  void operator()(MEGAInt i, const vector <MEGAInt> &neighbours)
  {
	Order.push_back(i);
	Neighbours.push_back(neighbours);
	sort(Neighbours.back().begin(), Neighbours.back().end());
  }
};

TEST_CASE("batched queries return every neighbour list in query order", "[kdtree]")
{
  ResetTestConfig(10., true);
  vector <MEGAxyz> x;
  RandomPositions(x, 1000, 10., 11);
  VectorPos_t data(x);
  KDTree_t tree;
  tree.Build(data);
  CellGrid_t grid;
  grid.Build(27, data);
  CHECK(grid.GetNDiv()==3);
  vector <MEGAInt> order;
  grid.GetQueryOrder(order);
  REQUIRE(order.size()==x.size());
  vector <MEGAInt> sorted_order(order);
  sort(sorted_order.begin(), sorted_order.end());
  for(MEGAInt i=0;i<(MEGAInt)x.size();i++)
	REQUIRE(sorted_order[i]==i);

  MEGAInt batchsize=GENERATE(1, 37, 5000);
  NeighbourRecorder_t recorder;
  BatchedRadiusQuery(tree, data, order, 0.8, batchsize, recorder);
  REQUIRE(recorder.Order==order);
  for(size_t i=0;i<order.size();i+=97)
	CHECK(recorder.Neighbours[i]==BruteForce(x, x[order[i]], 0.8, true));
}
