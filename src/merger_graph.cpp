#include <iostream>
#include <sstream>
#include <algorithm>
#include <stdexcept>

#include "merger_graph.h"
#include "disjoint_set.h"

class NodeKeyList_t: public KeyList_t <MEGAInt, MEGAInt>
{
  const vector <GraphNode_t> &Nodes;
public:
  NodeKeyList_t(const vector <GraphNode_t> &nodes): Nodes(nodes)
  {
  }
  MEGAInt GetKey(const MEGAInt i) const
  {
	return Nodes[i].GlobalId;
  }
  MEGAInt GetIndex(const MEGAInt i) const
  {
	return i;
  }
  MEGAInt size() const
  {
	return Nodes.size();
  }
};

void MergerGraph_t::FillNodeHash()
{
  NodeKeyList_t keys(Nodes);
  NodeHash.Fill(keys, -1);
  MEGAInt id;
  if(NodeHash.FindDuplicate(id))
  {
	stringstream msg;
	msg<<"halo "<<id<<" appears twice in the merger graph";
	throw logic_error(msg.str());
  }
  NumberOfHashedNodes=Nodes.size();
}

MEGAInt MergerGraph_t::GetNodeIndex(MEGAInt globalid) const
{
  if(NumberOfHashedNodes!=(MEGAInt)Nodes.size())
	throw logic_error("the node hash of the merger graph is out of date");
  return NodeHash.GetIndex(globalid);
}

GraphNode_t & MergerGraph_t::GetNode(MEGAInt globalid)
{
  MEGAInt i=GetNodeIndex(globalid);
  if(i<0)
  {
	stringstream msg;
	msg<<"halo "<<globalid<<" is not in the merger graph";
	throw out_of_range(msg.str());
  }
  return Nodes[i];
}
const GraphNode_t & MergerGraph_t::GetNode(MEGAInt globalid) const
{
  MEGAInt i=GetNodeIndex(globalid);
  if(i<0)
  {
	stringstream msg;
	msg<<"halo "<<globalid<<" is not in the merger graph";
	throw out_of_range(msg.str());
  }
  return Nodes[i];
}

void MergerGraph_t::AddSnapshot(int isnap, const vector <MEGAInt> &nparticles)
{
  if(FirstSnapshot<0||isnap<FirstSnapshot) FirstSnapshot=isnap;
  if(isnap>LastSnapshot) LastSnapshot=isnap;
  for(MEGAInt i=0;i<(MEGAInt)nparticles.size();i++)
  {
	GraphNode_t node;
	node.SnapshotIndex=isnap;
	node.HaloId=i;
	node.GlobalId=GetGlobalHaloId(isnap, i);
	node.Nparticles=nparticles[i];
	Nodes.push_back(node);
  }
}

void MergerGraph_t::AddLinks(int prog_snapshot, int desc_snapshot, const vector <DirectLink_t> &links)
{
  if(NumberOfHashedNodes!=(MEGAInt)Nodes.size())
	FillNodeHash();
  vector <MEGAInt> touched;
  touched.reserve(links.size()*2);
  for(auto &&l: links)
  {
	MEGAInt progid=GetGlobalHaloId(prog_snapshot, l.ProgenitorId), descid=GetGlobalHaloId(desc_snapshot, l.DescendantId);
	MEGAInt iprog=GetNodeIndex(progid), idesc=GetNodeIndex(descid);
	if(iprog<0||idesc<0)
	{
	  stringstream msg;
	  msg<<"link "<<progid<<"->"<<descid<<" refers to a halo that is not in the merger graph";
	  throw out_of_range(msg.str());
	}
	Nodes[iprog].Descendants.emplace_back(descid, l.SharedParticles);
	Nodes[idesc].Progenitors.emplace_back(progid, l.SharedParticles);
	touched.push_back(iprog);
	touched.push_back(idesc);
  }
  sort(touched.begin(), touched.end());
  touched.erase(unique(touched.begin(), touched.end()), touched.end());
  for(auto &&i: touched)
  {
	sort(Nodes[i].Progenitors.begin(), Nodes[i].Progenitors.end(), CompEdgeId);
	sort(Nodes[i].Descendants.begin(), Nodes[i].Descendants.end(), CompEdgeId);
  }
}

MEGAInt MergerGraph_t::IdentifyGraphs()
/*graph ids are assigned in order of the first node of each graph*/
{
  DisjointSet_t sets(Nodes.size());
  for(MEGAInt i=0;i<(MEGAInt)Nodes.size();i++)
  {
	for(auto &&e: Nodes[i].Progenitors)
	  sets.Union(i, GetNodeIndex(e.GlobalId));
	for(auto &&e: Nodes[i].Descendants)
	  sets.Union(i, GetNodeIndex(e.GlobalId));
  }
  vector <MEGAInt> labels;
  NumberOfGraphs=sets.CompactLabels(labels);
  for(MEGAInt i=0;i<(MEGAInt)Nodes.size();i++)
	Nodes[i].GraphId=labels[i];
  return NumberOfGraphs;
}

MEGAInt MergerGraph_t::CountHalos(int isnap) const
{
  MEGAInt n=0;
  for(auto &&node: Nodes)
	if(node.SnapshotIndex==isnap) n++;
  return n;
}

void MergerGraph_t::GetSaveOrder(vector <MEGAInt> &order) const
{
  order.resize(Nodes.size());
  for(MEGAInt i=0;i<(MEGAInt)Nodes.size();i++)
	order[i]=i;
  const vector <GraphNode_t> &nodes=Nodes;
  sort(order.begin(), order.end(), [&nodes](MEGAInt a, MEGAInt b) -> bool {
	if(nodes[a].GraphId!=nodes[b].GraphId) return nodes[a].GraphId<nodes[b].GraphId;
	if(nodes[a].SnapshotIndex!=nodes[b].SnapshotIndex) return nodes[a].SnapshotIndex<nodes[b].SnapshotIndex;
	return nodes[a].HaloId<nodes[b].HaloId;
  });
}
