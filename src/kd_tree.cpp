#include <algorithm>
#include <cmath>
#include <limits>

#include "kd_tree.h"

class CompAlongDim_t
{
  const PositionData_t &Data;
  int Dim;
public:
  CompAlongDim_t(const PositionData_t &data, int dim): Data(data), Dim(dim)
  {
  }
  bool operator()(MEGAInt a, MEGAInt b) const
  {
	return Data[a][Dim]<Data[b][Dim];
  }
};

void KDTree_t::Clear()
{
  vector <KDNode_t>().swap(Nodes);
  vector <MEGAInt>().swap(Index);
  Data=nullptr;
}

void KDTree_t::Build(const PositionData_t &data)
{
  Clear();
  Data=&data;
  IsPeriodic=MEGAConfig.PeriodicBoundaryOn&&MEGAConfig.BoxSize>0;
  MEGAInt np=data.size();
  Index.resize(np);
  for(MEGAInt i=0;i<np;i++)
	Index[i]=i;
  if(0==np) return;
  if(LeafSize<1) LeafSize=1;
  Nodes.reserve(2*np/LeafSize+1);

  vector <MEGAInt> stack(1, 0);
  KDNode_t root;
  root.Begin=0;
  root.End=np;
  Nodes.push_back(root);
  while(!stack.empty())
  {
	MEGAInt inode=stack.back();
	stack.pop_back();
	MEGAInt begin=Nodes[inode].Begin, end=Nodes[inode].End;
	MEGAxyz xmin=data[Index[begin]], xmax=xmin;
	for(MEGAInt i=begin+1;i<end;i++)
	{
	  auto &x=data[Index[i]];
	  for(int j=0;j<3;j++)
	  {
		if(x[j]<xmin[j]) xmin[j]=x[j];
		if(x[j]>xmax[j]) xmax[j]=x[j];
	  }
	}
	Nodes[inode].Min=xmin;
	Nodes[inode].Max=xmax;
	Nodes[inode].Left=Nodes[inode].Right=-1;
	if(end-begin<=LeafSize) continue;

	int dim=0;
	for(int j=1;j<3;j++)
	  if(xmax[j]-xmin[j]>xmax[dim]-xmin[dim]) dim=j;
	if(xmax[dim]==xmin[dim]) continue;//all points coincide

	MEGAInt mid=begin+(end-begin)/2;
	nth_element(Index.begin()+begin, Index.begin()+mid, Index.begin()+end, CompAlongDim_t(data, dim));

	KDNode_t left, right;
	left.Begin=begin;
	left.End=mid;
	right.Begin=mid;
	right.End=end;
	Nodes[inode].Left=Nodes.size();
	Nodes.push_back(left);
	Nodes[inode].Right=Nodes.size();
	Nodes.push_back(right);
	stack.push_back(Nodes[inode].Left);
	stack.push_back(Nodes[inode].Right);
  }
}

inline MEGAReal KDTree_t::AxisDistance(MEGAReal x, const KDNode_t &node, int dim) const
/*distance from x to the node extent along dim; zero if inside*/
{
  if(IsPeriodic)
  {
	MEGAReal halfwidth=(node.Max[dim]-node.Min[dim])/2.;
	MEGAReal dx=x-(node.Max[dim]+node.Min[dim])/2.;
	dx=fabs(NEAREST(dx))-halfwidth;
	return dx>0?dx:0.;
  }
  if(x<node.Min[dim]) return node.Min[dim]-x;
  if(x>node.Max[dim]) return x-node.Max[dim];
  return 0.;
}
inline MEGAReal KDTree_t::NodeDistance2(const MEGAxyz &center, const KDNode_t &node) const
{
  MEGAReal d2=0.;
  for(int j=0;j<3;j++)
  {
	MEGAReal d=AxisDistance(center[j], node, j);
	d2+=d*d;
  }
  return d2;
}
inline MEGAReal KDTree_t::PointDistance2(const MEGAxyz &center, const MEGAxyz &x) const
{
  MEGAReal d2=0.;
  for(int j=0;j<3;j++)
  {
	MEGAReal dx=x[j]-center[j];
	if(IsPeriodic) dx=NEAREST(dx);
	d2+=dx*dx;
  }
  return d2;
}

void KDTree_t::Search(const MEGAxyz &center, MEGAReal radius, ParticleCollector_t &collector) const
{
  if(Nodes.empty()) return;
  MEGAReal r2=radius*radius;
  vector <MEGAInt> stack;
  stack.reserve(64);
  stack.push_back(0);
  while(!stack.empty())
  {
	const KDNode_t &node=Nodes[stack.back()];
	stack.pop_back();
	if(NodeDistance2(center, node)>r2) continue;
	if(node.Left<0)
	{
	  for(MEGAInt i=node.Begin;i<node.End;i++)
	  {
		MEGAInt pid=Index[i];
		MEGAReal d2=PointDistance2(center, (*Data)[pid]);
		if(d2<=r2)
		  collector.Collect(pid, d2);
	  }
	}
	else
	{
	  stack.push_back(node.Left);
	  stack.push_back(node.Right);
	}
  }
}

MEGAInt KDTree_t::NearestNeighbour(const MEGAxyz &center, MEGAReal &d2min) const
{
  MEGAInt best=-1;
  d2min=numeric_limits<MEGAReal>::max();
  if(Nodes.empty()) return best;
  vector <MEGAInt> stack;
  stack.push_back(0);
  while(!stack.empty())
  {
	const KDNode_t &node=Nodes[stack.back()];
	stack.pop_back();
	if(NodeDistance2(center, node)>d2min) continue;
	if(node.Left<0)
	{
	  for(MEGAInt i=node.Begin;i<node.End;i++)
	  {
		MEGAReal d2=PointDistance2(center, (*Data)[Index[i]]);
		if(d2<d2min)
		{
		  d2min=d2;
		  best=Index[i];
		}
	  }
	}
	else
	{//visit the closer child first
	  MEGAReal dl=NodeDistance2(center, Nodes[node.Left]), dr=NodeDistance2(center, Nodes[node.Right]);
	  if(dl<dr)
	  {
		stack.push_back(node.Right);
		stack.push_back(node.Left);
	  }
	  else
	  {
		stack.push_back(node.Left);
		stack.push_back(node.Right);
	  }
	}
  }
  return best;
}
