#include <catch2/catch.hpp>
#include <algorithm>
#include <iterator>

#include "merger_graph.h"
#include "merger_tree.h"
#include "halo_linker.h"
#include "test_helpers.h"

static void FillCatalog(HaloSnapshot_t &catalog, int isnap, const vector <vector <MEGAInt> > &members)
{
  catalog.Clear();
  catalog.SnapshotIndex=isnap;
  catalog.SnapshotName=to_string(isnap);
  catalog.Halos.resize(members.size());
  for(MEGAInt i=0;i<(MEGAInt)members.size();i++)
  {
	auto &h=catalog.Halos[i];
	h.HaloId=i;
	h.GlobalId=GetGlobalHaloId(isnap, i);
	for(auto &&pid: members[i])
	  h.Particles.push_back(MakeParticle(pid, 0., 0., 0.));
	h.Nparticles=h.Particles.size();
  }
  catalog.TotNumberOfHalos=members.size();
}

static vector <MEGAInt> Range(MEGAInt first, MEGAInt last)
{
  vector <MEGAInt> ids;
  for(MEGAInt i=first;i<=last;i++)
	ids.push_back(i);
  return ids;
}

static vector <MEGAInt> Sizes(const HaloSnapshot_t &catalog)
{
  vector <MEGAInt> n;
  for(auto &&h: catalog.Halos)
	n.push_back(h.Particles.size());
  return n;
}

/*three progenitors of weights 5, 3 and 2 merge into halo 0 of snapshot 1; progenitor 1 also feeds halo 1*/
struct ThreeProgenitorFixture_t
{
  HaloSnapshot_t prior, current;
  MergerGraph_t graph;
  ThreeProgenitorFixture_t()
  {
	FillCatalog(prior, 0, {Range(1, 10), Range(11, 18), Range(19, 24)});
	vector <MEGAInt> merged=Range(1, 5);
	for(MEGAInt id: {11, 12, 13, 19, 20, 100, 101})
	  merged.push_back(id);
	FillCatalog(current, 1, {merged, Range(14, 17)});
	graph.AddSnapshot(0, Sizes(prior));
	graph.AddSnapshot(1, Sizes(current));
	vector <DirectLink_t> links;
	HaloLinker_t::LinkSerial(prior, current, links);
	graph.AddLinks(0, 1, links);
	graph.IdentifyGraphs();
  }
};

TEST_CASE("the graph keeps every progenitor edge", "[graph]")
{
  ThreeProgenitorFixture_t f;
  REQUIRE(f.graph.size()==5);
  CHECK(f.graph.NumberOfGraphs==1);
  CHECK(f.graph.CountHalos(1)==2);
  auto &node=f.graph.GetNode(GetGlobalHaloId(1, 0));
  REQUIRE(node.Progenitors.size()==3);
  CHECK(node.Progenitors[0].Weight==5);
  CHECK(node.Progenitors[1].Weight==3);
  CHECK(node.Progenitors[2].Weight==2);
  CHECK(f.graph.GetNode(GetGlobalHaloId(0, 1)).Descendants.size()==2);
  CHECK_THROWS_AS(f.graph.GetNode(GetGlobalHaloId(2, 0)), out_of_range);
}

TEST_CASE("splitting leaves every tree node with at most one progenitor", "[tree]")
{
  ThreeProgenitorFixture_t f;
  MergerTree_t tree;
  tree.Build(f.graph);

  REQUIRE(tree.Splits.size()==2);
  CHECK(tree.Splits[0].ProgenitorGlobalId==GetGlobalHaloId(0, 1));
  CHECK(tree.Splits[0].SplitGlobalId==GetGlobalHaloId(1, 2));
  CHECK(tree.Splits[0].Weight==3);
  CHECK(tree.Splits[1].ProgenitorGlobalId==GetGlobalHaloId(0, 2));
  CHECK(tree.Splits[1].SplitGlobalId==GetGlobalHaloId(1, 3));

  REQUIRE(tree.Tree.size()==7);
  for(auto &&node: tree.Tree.Nodes)
  {
	if(node.SnapshotIndex==1) CHECK(node.Progenitors.size()==1);
	else CHECK(node.Progenitors.empty());
  }
  auto &canonical=tree.Tree.GetNode(GetGlobalHaloId(1, 0));
  CHECK(canonical.Progenitors[0].GlobalId==GetGlobalHaloId(0, 0));
  CHECK(canonical.Progenitors[0].Weight==5);
  CHECK(canonical.Nparticles==12-3-2);

  auto &split=tree.Tree.GetNode(GetGlobalHaloId(1, 2));
  CHECK(split.SplitFrom==GetGlobalHaloId(1, 0));
  CHECK(split.Nparticles==3);
  CHECK(split.Descendants.empty());

  auto &prog=tree.Tree.GetNode(GetGlobalHaloId(0, 1));
  REQUIRE(prog.Descendants.size()==2);
  CHECK(prog.Descendants[0].GlobalId==GetGlobalHaloId(1, 1));
  CHECK(prog.Descendants[1].GlobalId==GetGlobalHaloId(1, 2));
  CHECK(tree.Tree.NumberOfGraphs==3);

  //the graph is left untouched
  CHECK(f.graph.size()==5);
  CHECK(f.graph.GetNode(GetGlobalHaloId(1, 0)).Progenitors.size()==3);

  HaloSnapshot_t first_tree, tree_catalog, none;
  tree.BuildTreeCatalog(f.prior, none, first_tree);
  tree.BuildTreeCatalog(f.current, f.prior, tree_catalog);
  vector <DirectLink_t> links;
  tree.LinkTreeCatalogs(first_tree, tree_catalog, links);
  REQUIRE(links.size()==4);
  CHECK((links[0].ProgenitorId==0&&links[0].DescendantId==0&&links[0].SharedParticles==5));
  CHECK((links[1].ProgenitorId==1&&links[1].DescendantId==1&&links[1].SharedParticles==4));
  CHECK((links[2].ProgenitorId==1&&links[2].DescendantId==2&&links[2].SharedParticles==3));
  CHECK((links[3].ProgenitorId==2&&links[3].DescendantId==3&&links[3].SharedParticles==2));
}

TEST_CASE("tree halos carry the split membership", "[tree]")
{
  ThreeProgenitorFixture_t f;
  MergerTree_t tree;
  tree.Build(f.graph);

  HaloSnapshot_t tree_catalog;
  tree.BuildTreeCatalog(f.current, f.prior, tree_catalog);
  REQUIRE(tree_catalog.size()==4);
  auto ids=[&tree_catalog](MEGAInt i) -> vector <MEGAInt> {
	vector <MEGAInt> v;
	for(auto &&p: tree_catalog.Halos[i].Particles) v.push_back(p.Id);
	return v;
  };
  vector <MEGAInt> canonical=Range(1, 5);
  canonical.push_back(100);
  canonical.push_back(101);
  CHECK(ids(0)==canonical);
  CHECK(ids(1)==Range(14, 17));
  CHECK(ids(2)==Range(11, 13));
  CHECK(ids(3)==Range(19, 20));
  CHECK(tree_catalog.Halos[2].SplitFrom==GetGlobalHaloId(1, 0));
  CHECK(tree_catalog.Halos[3].GlobalId==GetGlobalHaloId(1, 3));
  CHECK(tree_catalog.Halos[0].Nparticles==7);
  CHECK(tree_catalog.Halos[0].SplitFrom==SpecialConst::NullHaloId);

  HaloSnapshot_t first_catalog, none;
  tree.BuildTreeCatalog(f.prior, none, first_catalog);
  CHECK(first_catalog.size()==3);
}

static MEGAInt SharedMembers(const Halo_t &a, const Halo_t &b)
{
  vector <MEGAInt> ia, ib, common;
  for(auto &&p: a.Particles) ia.push_back(p.Id);
  for(auto &&p: b.Particles) ib.push_back(p.Id);
  sort(ia.begin(), ia.end());
  sort(ib.begin(), ib.end());
  set_intersection(ia.begin(), ia.end(), ib.begin(), ib.end(), back_inserter(common));
  return common.size();
}

TEST_CASE("tree links are weighted by the members of the tree halos", "[tree]")
{
  //two halos merge at snapshot 1 and the merged halo carries on unchanged
  HaloSnapshot_t catalogs[3];
  FillCatalog(catalogs[0], 0, {Range(1, 12), Range(13, 20)});
  FillCatalog(catalogs[1], 1, {Range(1, 20)});
  FillCatalog(catalogs[2], 2, {Range(1, 20)});
  MergerGraph_t graph;
  for(int isnap=0;isnap<3;isnap++)
	graph.AddSnapshot(isnap, Sizes(catalogs[isnap]));
  graph.FillNodeHash();
  for(int isnap=1;isnap<3;isnap++)
  {
	vector <DirectLink_t> links;
	HaloLinker_t::LinkSerial(catalogs[isnap-1], catalogs[isnap], links);
	graph.AddLinks(isnap-1, isnap, links);
  }
  graph.IdentifyGraphs();
  REQUIRE(graph.GetNode(GetGlobalHaloId(2, 0)).Progenitors.size()==1);
  CHECK(graph.GetNode(GetGlobalHaloId(2, 0)).Progenitors[0].Weight==20);

  MergerTree_t tree;
  tree.Build(graph);
  HaloSnapshot_t tree_catalogs[3], none;
  tree.BuildTreeCatalog(catalogs[0], none, tree_catalogs[0]);
  for(int isnap=1;isnap<3;isnap++)
	tree.BuildTreeCatalog(catalogs[isnap], catalogs[isnap-1], tree_catalogs[isnap]);
  REQUIRE(tree_catalogs[1].size()==2);
  CHECK(tree_catalogs[1].Halos[0].Nparticles==12);
  CHECK(tree_catalogs[1].Halos[1].Nparticles==8);

  vector <DirectLink_t> links[3];
  for(int isnap=1;isnap<3;isnap++)
	tree.LinkTreeCatalogs(tree_catalogs[isnap-1], tree_catalogs[isnap], links[isnap]);
  tree.Tree.IdentifyGraphs();

  for(int isnap=1;isnap<3;isnap++)
	for(auto &&l: links[isnap])
	  CHECK(l.SharedParticles==SharedMembers(tree_catalogs[isnap-1].Halos[l.ProgenitorId], tree_catalogs[isnap].Halos[l.DescendantId]));
  REQUIRE(links[2].size()==2);
  CHECK((links[2][0].ProgenitorId==0&&links[2][0].DescendantId==0&&links[2][0].SharedParticles==12));
  CHECK((links[2][1].ProgenitorId==1&&links[2][1].DescendantId==0&&links[2][1].SharedParticles==8));

  //the split keeps its descendant edge while the merged halo keeps only its canonical progenitor
  auto &merged=tree.Tree.GetNode(GetGlobalHaloId(2, 0));
  REQUIRE(merged.Progenitors.size()==1);
  CHECK(merged.Progenitors[0].GlobalId==GetGlobalHaloId(1, 0));
  CHECK(merged.Progenitors[0].Weight==12);
  auto &split=tree.Tree.GetNode(GetGlobalHaloId(1, 1));
  CHECK(split.SplitFrom==GetGlobalHaloId(1, 0));
  REQUIRE(split.Descendants.size()==1);
  CHECK(split.Descendants[0].GlobalId==GetGlobalHaloId(2, 0));
  CHECK(split.Descendants[0].Weight==8);
  for(auto &&node: tree.Tree.Nodes)
	CHECK(node.Progenitors.size()<=1);
  CHECK(tree.Tree.NumberOfGraphs==1);

  CHECK_THROWS_AS(tree.LinkTreeCatalogs(tree_catalogs[0], tree_catalogs[2], links[0]), invalid_argument);
}

TEST_CASE("links added in pieces keep the edges sorted", "[graph]")
{
  MergerGraph_t graph;
  graph.AddSnapshot(0, {3, 3, 3});
  graph.AddSnapshot(1, {5, 4});
  CHECK_THROWS_AS(graph.GetNode(GetGlobalHaloId(0, 0)), logic_error);
  graph.FillNodeHash();
  CHECK(graph.GetNode(GetGlobalHaloId(1, 1)).Nparticles==4);

  graph.AddLinks(0, 1, {DirectLink_t(2, 0, 1), DirectLink_t(0, 1, 2)});
  graph.AddLinks(0, 1, {DirectLink_t(1, 0, 3), DirectLink_t(0, 0, 1)});
  auto &desc=graph.GetNode(GetGlobalHaloId(1, 0));
  REQUIRE(desc.Progenitors.size()==3);
  CHECK(desc.Progenitors[0].GlobalId==GetGlobalHaloId(0, 0));
  CHECK(desc.Progenitors[1].GlobalId==GetGlobalHaloId(0, 1));
  CHECK(desc.Progenitors[2].GlobalId==GetGlobalHaloId(0, 2));
  auto &prog=graph.GetNode(GetGlobalHaloId(0, 0));
  REQUIRE(prog.Descendants.size()==2);
  CHECK(prog.Descendants[0].GlobalId==GetGlobalHaloId(1, 0));
  CHECK(prog.Descendants[1].GlobalId==GetGlobalHaloId(1, 1));

  //a snapshot added after some links is hashed by the next call
  graph.AddSnapshot(2, {6});
  graph.AddLinks(1, 2, {DirectLink_t(1, 0, 4)});
  CHECK(graph.GetNode(GetGlobalHaloId(2, 0)).Progenitors.size()==1);
  CHECK_THROWS_AS(graph.AddLinks(1, 2, {DirectLink_t(5, 0, 1)}), out_of_range);
  CHECK(graph.IdentifyGraphs()==1);
}

TEST_CASE("equal progenitor weights go to the lowest id", "[tree]")
{
  vector <GraphEdge_t> edges={GraphEdge_t(30, 4), GraphEdge_t(10, 4), GraphEdge_t(20, 1)};
  CHECK(SelectCanonicalProgenitor(edges)==1);
  edges.push_back(GraphEdge_t(40, 6));
  CHECK(SelectCanonicalProgenitor(edges)==3);
  CHECK(SelectCanonicalProgenitor(vector <GraphEdge_t>())==-1);

  MergerGraph_t graph;
  graph.AddSnapshot(0, {4, 4});
  graph.AddSnapshot(1, {8});
  graph.AddLinks(0, 1, {DirectLink_t(1, 0, 4), DirectLink_t(0, 0, 4)});
  MergerTree_t tree;
  tree.Build(graph);
  REQUIRE(tree.Splits.size()==1);
  CHECK(tree.Splits[0].ProgenitorGlobalId==GetGlobalHaloId(0, 1));
  CHECK(tree.Tree.GetNode(GetGlobalHaloId(1, 0)).Progenitors[0].GlobalId==GetGlobalHaloId(0, 0));
}

TEST_CASE("split membership", "[tree]")
{
  vector <MEGAInt> host=Range(1, 10);
  vector <vector <MEGAInt> > progs={{1, 2, 3, 20}, {5, 6}}, splits;
  vector <MEGAInt> remainder;
  SplitMembers(host, progs, splits, remainder);
  REQUIRE(splits.size()==2);
  CHECK(splits[0]==vector<MEGAInt>({1, 2, 3}));
  CHECK(splits[1]==vector<MEGAInt>({5, 6}));
  CHECK(remainder==vector<MEGAInt>({4, 7, 8, 9, 10}));
}
