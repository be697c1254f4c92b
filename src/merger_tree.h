#ifndef MERGER_TREE_H_INCLUDED
#define MERGER_TREE_H_INCLUDED

#include <vector>
#include "merger_graph.h"
#include "halo.h"

/*a secondary identity created for a halo with more than one progenitor*/
struct SplitRecord_t
{
  int SnapshotIndex;
  MEGAInt HostGlobalId;
  MEGAInt SplitGlobalId;
  MEGAInt ProgenitorGlobalId;
  MEGAInt Weight;
  SplitRecord_t(){};
  SplitRecord_t(int isnap, MEGAInt host, MEGAInt split, MEGAInt prog, MEGAInt weight): SnapshotIndex(isnap), HostGlobalId(host), SplitGlobalId(split), ProgenitorGlobalId(prog), Weight(weight)
  {
  }
};

/*index of the canonical progenitor: the heaviest edge, ties going to the lowest GlobalId. -1 if empty.*/
extern int SelectCanonicalProgenitor(const vector <GraphEdge_t> &progenitors);

class MergerTree_t
/*single-progenitor simplification of a merger graph. the graph itself is not modified.*/
{
public:
  MergerGraph_t Tree;
  vector <SplitRecord_t> Splits;//ordered by snapshot, then host HaloId, then progenitor GlobalId
  void Build(const MergerGraph_t &graph);
  void GetSplits(int isnap, vector <SplitRecord_t> &splits) const;
  /*catalog of the tree halos of one snapshot, from the graph catalogs of that snapshot and the previous one*/
  void BuildTreeCatalog(const HaloSnapshot_t &catalog, const HaloSnapshot_t &prior, HaloSnapshot_t &tree_catalog) const;
  void LinkTreeCatalogs(const HaloSnapshot_t &prior_tree, const HaloSnapshot_t &tree_catalog, vector <DirectLink_t> &links);
  void Save(const string &filename) const
  {
	Tree.Save(filename);
  }
};

/*split off the members shared with each progenitor; the remainder stays with the host. all lists sorted by id.*/
extern void SplitMembers(const vector <MEGAInt> &host, const vector <vector <MEGAInt> > &progenitors, vector <vector <MEGAInt> > &splits, vector <MEGAInt> &remainder);

#endif
