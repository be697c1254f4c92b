#ifndef MERGER_GRAPH_H_INCLUDED
#define MERGER_GRAPH_H_INCLUDED

#include <vector>
#include "datatypes.h"
#include "hash.h"
#include "halo_linker.h"

struct GraphEdge_t
{
  MEGAInt GlobalId;//of the halo at the other end
  MEGAInt Weight;//shared particles
  GraphEdge_t(){};
  GraphEdge_t(MEGAInt id, MEGAInt weight): GlobalId(id), Weight(weight)
  {
  }
};
inline bool CompEdgeId(const GraphEdge_t &a, const GraphEdge_t &b)
{
  return a.GlobalId<b.GlobalId;
}

struct GraphNode_t
{
  MEGAInt GlobalId;
  int SnapshotIndex;
  MEGAInt HaloId;
  MEGAInt Nparticles;
  MEGAInt SplitFrom;
  MEGAInt GraphId;
  vector <GraphEdge_t> Progenitors, Descendants;//sorted by GlobalId
  GraphNode_t(): GlobalId(SpecialConst::NullHaloId), SnapshotIndex(SpecialConst::NullSnapshotId), HaloId(SpecialConst::NullHaloId), Nparticles(0), SplitFrom(SpecialConst::NullHaloId), GraphId(-1), Progenitors(), Descendants()
  {
  }
};

inline MEGAInt GetGlobalHaloId(int isnap, MEGAInt haloid)
{
  return isnap*SpecialConst::HaloIdStride+haloid;
}

class MergerGraph_t
/*halos of a range of snapshots linked by their shared particles. a graph is a connected set of nodes.*/
{
  MappedIndexTable_t<MEGAInt, MEGAInt> NodeHash;
  MEGAInt NumberOfHashedNodes;
public:
  vector <GraphNode_t> Nodes;
  MEGAInt NumberOfGraphs;
  int FirstSnapshot, LastSnapshot;
  MergerGraph_t(): NodeHash(), NumberOfHashedNodes(0), Nodes(), NumberOfGraphs(0), FirstSnapshot(SpecialConst::NullSnapshotId), LastSnapshot(SpecialConst::NullSnapshotId)
  {
  }
  MEGAInt size() const
  {
	return Nodes.size();
  }
  /*nodes for halos 0..n-1 of the snapshot. the node hash is left to AddLinks or FillNodeHash.*/
  void AddSnapshot(int isnap, const vector <MEGAInt> &nparticles);
  /*refills the node hash only if nodes were added since it was last filled*/
  void AddLinks(int prog_snapshot, int desc_snapshot, const vector <DirectLink_t> &links);
  void FillNodeHash();
  /*-1 if the halo is not in the graph. throws if nodes were added after the hash was filled.*/
  MEGAInt GetNodeIndex(MEGAInt globalid) const;
  GraphNode_t & GetNode(MEGAInt globalid);
  const GraphNode_t & GetNode(MEGAInt globalid) const;
  MEGAInt IdentifyGraphs();
  MEGAInt CountHalos(int isnap) const;
  /*node indices ordered by (graph, snapshot, halo)*/
  void GetSaveOrder(vector <MEGAInt> &order) const;
  void Save(const string &filename) const;
  void BuildFromCatalogs(int first_snapshot, int last_snapshot);
};

#endif
