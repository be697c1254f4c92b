#include <iostream>
#include <sstream>
#include <algorithm>
#include <iterator>
#include <map>
#include <stdexcept>

#include "merger_tree.h"
#include "halo_linker.h"

int SelectCanonicalProgenitor(const vector <GraphEdge_t> &progenitors)
{
  int best=-1;
  for(int i=0;i<(int)progenitors.size();i++)
  {
	if(best<0) best=i;
	else if(progenitors[i].Weight>progenitors[best].Weight) best=i;
	else if(progenitors[i].Weight==progenitors[best].Weight&&progenitors[i].GlobalId<progenitors[best].GlobalId) best=i;
  }
  return best;
}

static void RedirectDescendant(GraphNode_t &progenitor, MEGAInt old_id, MEGAInt new_id)
{
  for(auto &&e: progenitor.Descendants)
	if(e.GlobalId==old_id)
	{
	  e.GlobalId=new_id;
	  return;
	}
  stringstream msg;
  msg<<"halo "<<progenitor.GlobalId<<" has no descendant edge to "<<old_id;
  throw logic_error(msg.str());
}

void MergerTree_t::Build(const MergerGraph_t &graph)
/*split every halo with several progenitors so that each node keeps a single progenitor edge.
 * split nodes of a snapshot are numbered after its halos, in host order, then progenitor order.*/
{
  Tree=graph;
  Splits.clear();

  vector <MEGAInt> order(graph.Nodes.size());
  for(MEGAInt i=0;i<(MEGAInt)order.size();i++)
	order[i]=i;
  const vector <GraphNode_t> &nodes=graph.Nodes;
  sort(order.begin(), order.end(), [&nodes](MEGAInt a, MEGAInt b) -> bool {
	if(nodes[a].SnapshotIndex!=nodes[b].SnapshotIndex) return nodes[a].SnapshotIndex<nodes[b].SnapshotIndex;
	return nodes[a].HaloId<nodes[b].HaloId;
  });

  map <int, MEGAInt> NextHaloId;
  for(auto &&node: graph.Nodes)
  {
	MEGAInt &n=NextHaloId[node.SnapshotIndex];
	n=max(n, node.HaloId+1);
  }

  vector <GraphNode_t> NewNodes;
  for(auto &&i: order)
  {
	auto &node=graph.Nodes[i];
	if(node.Progenitors.size()<2) continue;
	int canonical=SelectCanonicalProgenitor(node.Progenitors);
	auto &host=Tree.Nodes[i];
	for(int k=0;k<(int)node.Progenitors.size();k++)
	{
	  if(k==canonical) continue;
	  auto &edge=node.Progenitors[k];
	  GraphNode_t split;
	  split.SnapshotIndex=node.SnapshotIndex;
	  split.HaloId=NextHaloId[node.SnapshotIndex]++;
	  if(split.HaloId>=SpecialConst::HaloIdStride)
		throw runtime_error("too many tree halos in one snapshot for the global id scheme");
	  split.GlobalId=GetGlobalHaloId(split.SnapshotIndex, split.HaloId);
	  split.Nparticles=edge.Weight;
	  split.SplitFrom=node.GlobalId;
	  split.Progenitors.push_back(edge);
	  RedirectDescendant(Tree.GetNode(edge.GlobalId), node.GlobalId, split.GlobalId);
	  host.Nparticles-=edge.Weight;
	  Splits.emplace_back(node.SnapshotIndex, node.GlobalId, split.GlobalId, edge.GlobalId, edge.Weight);
	  NewNodes.push_back(split);
	}
	GraphEdge_t kept=node.Progenitors[canonical];
	host.Progenitors.assign(1, kept);
  }

  Tree.Nodes.insert(Tree.Nodes.end(), NewNodes.begin(), NewNodes.end());
  Tree.FillNodeHash();
  for(auto &&node: Tree.Nodes)
	sort(node.Descendants.begin(), node.Descendants.end(), CompEdgeId);
  Tree.IdentifyGraphs();
}

void MergerTree_t::GetSplits(int isnap, vector <SplitRecord_t> &splits) const
{
  splits.clear();
  for(auto &&s: Splits)
	if(s.SnapshotIndex==isnap)
	  splits.push_back(s);
}

void SplitMembers(const vector <MEGAInt> &host, const vector <vector <MEGAInt> > &progenitors, vector <vector <MEGAInt> > &splits, vector <MEGAInt> &remainder)
{
  splits.resize(progenitors.size());
  vector <MEGAInt> taken;
  for(size_t k=0;k<progenitors.size();k++)
  {
	splits[k].clear();
	set_intersection(host.begin(), host.end(), progenitors[k].begin(), progenitors[k].end(), back_inserter(splits[k]));
	taken.insert(taken.end(), splits[k].begin(), splits[k].end());
  }
  sort(taken.begin(), taken.end());
  remainder.clear();
  set_difference(host.begin(), host.end(), taken.begin(), taken.end(), back_inserter(remainder));
}

static void GetSortedIds(const Halo_t &halo, vector <MEGAInt> &ids)
{
  ids.resize(halo.Particles.size());
  for(size_t i=0;i<ids.size();i++)
	ids[i]=halo.Particles[i].Id;
  sort(ids.begin(), ids.end());
}

void MergerTree_t::BuildTreeCatalog(const HaloSnapshot_t &catalog, const HaloSnapshot_t &prior, HaloSnapshot_t &tree_catalog) const
{
  int isnap=catalog.SnapshotIndex;
  tree_catalog.Clear();
  tree_catalog.SnapshotIndex=isnap;
  tree_catalog.SnapshotName=catalog.SnapshotName;
  tree_catalog.Cosmology=catalog.Cosmology;
  tree_catalog.LinkingLength=catalog.LinkingLength;
  tree_catalog.Halos=catalog.Halos;

  vector <SplitRecord_t> splits;
  GetSplits(isnap, splits);
  auto it=splits.begin();
  while(it!=splits.end())
  {
	auto host_end=it;
	while(host_end!=splits.end()&&host_end->HostGlobalId==it->HostGlobalId) ++host_end;

	MEGAInt hostid=it->HostGlobalId-GetGlobalHaloId(isnap, 0);
	if(hostid<0||hostid>=catalog.size())
	  throw out_of_range("split host is not in the halo catalog of snapshot "+catalog.SnapshotName);
	vector <MEGAInt> host;
	GetSortedIds(catalog.Halos[hostid], host);
	vector <vector <MEGAInt> > progs;
	for(auto s=it;s!=host_end;++s)
	{
	  MEGAInt progid=s->ProgenitorGlobalId-GetGlobalHaloId(prior.SnapshotIndex, 0);
	  if(prior.SnapshotIndex!=isnap-1||progid<0||progid>=prior.size())
		throw out_of_range("split progenitor is not in the halo catalog of the previous snapshot");
	  progs.emplace_back();
	  GetSortedIds(prior.Halos[progid], progs.back());
	}
	vector <vector <MEGAInt> > members;
	vector <MEGAInt> remainder;
	SplitMembers(host, progs, members, remainder);

	auto &canonical=tree_catalog.Halos[hostid];
	canonical.Particles.clear();
	for(auto &&pid: remainder)
	  canonical.Particles.emplace_back(pid, SpecialConst::NullCoordinate, SpecialConst::NullCoordinate);
	canonical.Nparticles=canonical.Particles.size();

	for(auto s=it;s!=host_end;++s)
	{
	  auto &ids=members[s-it];
	  if((MEGAInt)ids.size()!=s->Weight)
	  {
		stringstream msg;
		msg<<"split of halo "<<s->HostGlobalId<<" holds "<<ids.size()<<" particles but its link weight is "<<s->Weight;
		throw logic_error(msg.str());
	  }
	  Halo_t halo;
	  halo.GlobalId=s->SplitGlobalId;
	  halo.HaloId=s->SplitGlobalId-GetGlobalHaloId(isnap, 0);
	  halo.SplitFrom=s->HostGlobalId;
	  halo.Nparticles=ids.size();
	  halo.Particles.reserve(ids.size());
	  for(auto &&pid: ids)
		halo.Particles.emplace_back(pid, SpecialConst::NullCoordinate, SpecialConst::NullCoordinate);
	  tree_catalog.Halos.push_back(halo);
	}
	it=host_end;
  }
  for(MEGAInt i=0;i<tree_catalog.size();i++)
	if(tree_catalog.Halos[i].HaloId!=i)
	  throw logic_error("tree halo ids are not contiguous in snapshot "+catalog.SnapshotName);
  tree_catalog.TotNumberOfHalos=tree_catalog.size();
}

void MergerTree_t::LinkTreeCatalogs(const HaloSnapshot_t &prior_tree, const HaloSnapshot_t &tree_catalog, vector <DirectLink_t> &links)
/*direct links between the tree halos of consecutive snapshots, weighted by their shared members.
 * they replace the tree edges between the two snapshots. a progenitor keeps all its descendant edges
 * while a descendant keeps only its canonical progenitor, so a split rejoining its host still points at the merged halo.*/
{
  int prog_snap=prior_tree.SnapshotIndex, desc_snap=tree_catalog.SnapshotIndex;
  if(desc_snap!=prog_snap+1)
  {
	stringstream msg;
	msg<<"tree catalogs of snapshots "<<prog_snap<<" and "<<desc_snap<<" are not consecutive";
	throw invalid_argument(msg.str());
  }
  HaloLinker_t::LinkSerial(prior_tree, tree_catalog, links);

  for(auto &&node: Tree.Nodes)
  {
	if(node.SnapshotIndex==prog_snap) node.Descendants.clear();
	if(node.SnapshotIndex==desc_snap) node.Progenitors.clear();
  }
  Tree.AddLinks(prog_snap, desc_snap, links);
  for(auto &&node: Tree.Nodes)
  {
	if(node.SnapshotIndex!=desc_snap||node.Progenitors.size()<2) continue;
	GraphEdge_t kept=node.Progenitors[SelectCanonicalProgenitor(node.Progenitors)];
	node.Progenitors.assign(1, kept);
  }
}
