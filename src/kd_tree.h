#ifndef KD_TREE_H_INCLUDED
#define KD_TREE_H_INCLUDED

#include <vector>
#include <omp.h>

#include "datatypes.h"
#include "config_parser.h"
#include "snapshot.h"

class PositionData_t
{
public:
  virtual const MEGAxyz & operator [](MEGAInt i) const=0;
  virtual size_t size() const=0;
  virtual ~PositionData_t()
  {}
};
class ParticlePos_t: public PositionData_t
{
  const vector <Particle_t> &Particles;
public:
  ParticlePos_t(const vector <Particle_t> &particles):Particles(particles)
    {}
  const MEGAxyz & operator [](MEGAInt i) const
    {  return Particles[i].ComovingPosition;  }
  size_t size() const
    {  return Particles.size();  }
};
class VectorPos_t: public PositionData_t
{
  const vector <MEGAxyz> &Positions;
public:
  VectorPos_t(const vector <MEGAxyz> &positions):Positions(positions)
    {}
  const MEGAxyz & operator [](MEGAInt i) const
    {  return Positions[i];  }
  size_t size() const
    {  return Positions.size();  }
};

class KDTree_t
/*a balanced binary tree split at the median of the widest dimension. leaves hold at most LeafSize points.
 * periodic searches use the box of MEGAConfig when PeriodicBoundaryOn.
 * the indices used and returned refer to the points in the input position data*/
{
public:
  struct KDNode_t
  {
	MEGAInt Begin, End;//range in Index
	MEGAInt Left, Right;//children; -1 for leaves
	MEGAxyz Min, Max;//bounding box of the points
  };
private:
  vector <KDNode_t> Nodes;
  vector <MEGAInt> Index;
  const PositionData_t *Data;
  int LeafSize;
  bool IsPeriodic;
  MEGAReal AxisDistance(MEGAReal x, const KDNode_t &node, int dim) const;
  MEGAReal NodeDistance2(const MEGAxyz &center, const KDNode_t &node) const;
  MEGAReal PointDistance2(const MEGAxyz &center, const MEGAxyz &x) const;
public:
  KDTree_t(int leafsize=16): Nodes(), Index(), Data(nullptr), LeafSize(leafsize), IsPeriodic(false)
  {
  }
  void Build(const PositionData_t &data);
  void Clear();
  MEGAInt size() const
  {
	return Index.size();
  }
  /*collect every point within radius (inclusive) of center*/
  void Search(const MEGAxyz &center, MEGAReal radius, ParticleCollector_t &collector) const;
  /*the closest point to center, or -1 for an empty tree*/
  MEGAInt NearestNeighbour(const MEGAxyz &center, MEGAReal &d2min) const;
};

/*radius queries for the points in query_order, run in batches of at most batchsize.
 * each batch is searched in parallel; consumer(i, neighbours) is then called serially in query order.*/
template <class BatchConsumer_T>
void BatchedRadiusQuery(const KDTree_t &tree, const PositionData_t &points, const vector <MEGAInt> &query_order, MEGAReal radius, MEGAInt batchsize, BatchConsumer_T &consumer)
{
  if(batchsize<1) batchsize=1;
  MEGAInt nquery=query_order.size();
  vector <vector <MEGAInt> > neighbours;
  for(MEGAInt begin=0;begin<nquery;begin+=batchsize)
  {
	MEGAInt end=min(begin+batchsize, nquery);
	neighbours.resize(end-begin);
	#pragma omp parallel for schedule(dynamic,64)
	for(MEGAInt i=begin;i<end;i++)
	{
	  IndexCollector_t collector;
	  tree.Search(points[query_order[i]], radius, collector);
	  neighbours[i-begin].swap(collector.Indices);
	}
	for(MEGAInt i=begin;i<end;i++)
	  consumer(query_order[i], neighbours[i-begin]);
  }
}

#endif
