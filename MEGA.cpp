using namespace std;
#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <omp.h>

#include "src/datatypes.h"
#include "src/config_parser.h"
#include "src/stage_graph.h"
#include "src/snapshot.h"
#include "src/halo.h"
#include "src/halo_finder.h"
#include "src/halo_linker.h"
#include "src/merger_graph.h"
#include "src/merger_tree.h"
#include "src/mymath.h"

static void FindHalos(MpiWorker_t &world, int snapshot_start, int snapshot_end)
{
  HaloSnapshot_t catalogs[2];
  HaloSnapshot_t *prior=&catalogs[0], *current=&catalogs[1];
  bool has_prior=false;
  if(snapshot_start>0)
  {
	string snapname=MEGAConfig.GetSnapshotName(snapshot_start-1);
	prior->Load(world, HaloSnapshot_t::GetFileName(MEGAConfig.HaloSavePath, "halos", snapname));
	prior->FillParticleHash();
	has_prior=true;
  }

  ofstream time_log;
  if(MEGAConfig.Profile)
  {
	string filename=MEGAConfig.ProfilingPath+to_string(world.rank())+".txt";
	mkdir_for_path(filename);
	time_log.open(filename, fstream::out|fstream::app);
	if(!time_log.is_open())
	  throw runtime_error("failed to open profiling file "+filename);
	time_log<<fixed<<setprecision(3);
  }

  Timer_t timer;
  HaloFinder_t finder;
  HaloLinker_t linker;
  for(int isnap=snapshot_start;isnap<=snapshot_end;isnap++)
  {
	timer.Tick(world.Communicator);
	ParticleSnapshot_t partsnap;
	partsnap.Load(world, isnap);
	timer.Tick(world.Communicator);

	finder.Find(world, partsnap, has_prior?prior:nullptr, *current, timer);
	partsnap.Clear();
	if(MEGAConfig.Verbose)
	  finder.PrintStats(world);

	if(MEGAConfig.StageEnabled(StageGraphDirect)&&has_prior)
	{
	  vector <DirectLink_t> links;
	  if(world.size()==1)
		HaloLinker_t::LinkSerial(*prior, *current, links);
	  else
		linker.Link(world, *prior, *current, links);
	  if(world.rank()==0)
	  {
		string filename=HaloLinker_t::GetFileName(MEGAConfig.DirectGraphSavePath, "Mgraph", current->SnapshotName);
		HaloLinker_t::SaveLinks(filename, prior->SnapshotIndex, current->SnapshotIndex, links);
		cout<<links.size()<<" direct links saved to "<<filename<<endl;
	  }
	}
	timer.Tick(world.Communicator);

	current->Save(world, HaloSnapshot_t::GetFileName(MEGAConfig.HaloSavePath, "halos", current->SnapshotName));
	timer.Tick(world.Communicator);

	if(MEGAConfig.Profile)
	{
	  time_log<<isnap;
	  for(int i=1;i<timer.Size();i++)
		time_log<<"\t"<<timer.GetSeconds(i);
	  time_log<<endl;
	}
	timer.Reset();

	prior->Clear();
	swap(prior, current);
	prior->FillParticleHash();
	has_prior=true;
  }
}

static void BuildTrees(const MergerGraph_t &graph, int snapshot_end)
{
  MergerTree_t tree;
  tree.Build(graph);
  cout<<tree.Splits.size()<<" halos split off for the merger trees\n";

  HaloSnapshot_t catalogs[2], tree_catalogs[2];
  HaloSnapshot_t *prior=&catalogs[0], *current=&catalogs[1];
  HaloSnapshot_t *prior_tree=&tree_catalogs[0], *current_tree=&tree_catalogs[1];
  for(int isnap=graph.FirstSnapshot;isnap<=snapshot_end;isnap++)
  {
	string snapname=MEGAConfig.GetSnapshotName(isnap);
	current->ReadFile(HaloSnapshot_t::GetFileName(MEGAConfig.HaloSavePath, "halos", snapname));
	tree.BuildTreeCatalog(*current, *prior, *current_tree);
	string filename=HaloSnapshot_t::GetFileName(MEGAConfig.TreeHaloSavePath, "treehalos", snapname);
	current_tree->WriteFile(filename);
	cout<<current_tree->size()<<" tree halos saved to "<<filename<<endl;

	if(MEGAConfig.StageEnabled(StageTreeDirect)&&isnap>graph.FirstSnapshot)
	{
	  vector <DirectLink_t> links;
	  tree.LinkTreeCatalogs(*prior_tree, *current_tree, links);
	  filename=HaloLinker_t::GetFileName(MEGAConfig.DirectTreeSavePath, "Mtree", snapname);
	  HaloLinker_t::SaveLinks(filename, isnap-1, isnap, links);
	  cout<<links.size()<<" direct tree links saved to "<<filename<<endl;
	}
	swap(prior, current);
	swap(prior_tree, current_tree);
  }
  tree.Tree.IdentifyGraphs();

  if(MEGAConfig.StageEnabled(StageTree))
  {
	string filename=MEGAConfig.TreeSavePath+"FullMtrees.hdf5";
	tree.Save(filename);
	cout<<tree.Tree.NumberOfGraphs<<" merger trees of "<<tree.Tree.size()<<" halos saved to "<<filename<<endl;
  }
}

static void RunMEGA(MpiWorker_t &world, int argc, char **argv)
{
  int snapshot_start, snapshot_end;
  if(0==world.rank())
  {
	ParseMEGAParams(argc, argv, MEGAConfig, snapshot_start, snapshot_end);
	MEGAConfig.DumpParameters();
	cout<<argv[0]<<" run using "<<world.size()<<" mpi tasks, each with "<<omp_get_max_threads()<<" threads\n";
	for(auto &&stage: StageGraph_t().UnsupportedStages(MEGAConfig.StageFlags))
	  cout<<"stage '"<<StageGraph_t::Name(stage)<<"' is enabled but not supported; skipped\n";
  }
  MEGAConfig.BroadCast(world, 0, snapshot_start, snapshot_end);
  if(MEGAConfig.UseSerial&&world.size()>1)
	throw ConfigError_t("flags:useserial requires a single mpi task");

  if(MEGAConfig.StageEnabled(StageHalo))
	FindHalos(world, snapshot_start, snapshot_end);

  if(MEGAConfig.StageEnabled(StageGraph)&&0==world.rank())
  {
	MergerGraph_t graph;
	graph.BuildFromCatalogs(0, snapshot_end);
	string filename=MEGAConfig.GraphSavePath+"FullMgraphs.hdf5";
	graph.Save(filename);
	cout<<graph.NumberOfGraphs<<" merger graphs of "<<graph.size()<<" halos saved to "<<filename<<endl;

	if(MEGAConfig.StageEnabled(StageTreeHalos))
	  BuildTrees(graph, snapshot_end);
  }
  MPI_Barrier(world.Communicator);
}

int main(int argc, char **argv)
{
#ifdef _OPENMP
  omp_set_max_active_levels(1);
#endif
  MPI_Init(&argc, &argv);
  MpiWorker_t world(MPI_COMM_WORLD);
  try
  {
	RunMEGA(world, argc, argv);
  }
  catch(const exception &e)
  {
	cerr<<"rank "<<world.rank()<<": "<<e.what()<<endl;
	MPI_Abort(world.Communicator, 1);
  }
  MPI_Finalize();
  return 0;
}
