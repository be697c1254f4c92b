#include <catch2/catch.hpp>

#include "halo_finder.h"
#include "halo_linker.h"
#include "merger_graph.h"
#include "test_helpers.h"

/*a 125-particle clump straddling the x=0 face, a 64-particle clump and isolated field particles.
 * the second snapshot moves both clumps and adds a new 27-particle clump.*/
static void MakeSnapshotParticles(int isnap, vector <Particle_t> &particles)
{
  particles.clear();
  MEGAxyz still={{0., 0., 0.}}, drift={{50., -20., 10.}};
  MEGAReal shift=isnap*0.5;
  AddLattice(particles, 0, MEGAxyz{{shift, 50., 50.}}, 5, 0.3, still);
  AddLattice(particles, 1000, MEGAxyz{{70., 70.+shift, 30.}}, 4, 0.3, drift);
  if(isnap>0)
	AddLattice(particles, 2000, MEGAxyz{{40., 20., 80.}}, 3, 0.3, still);
  for(int i=0;i<20;i++)
	particles.push_back(MakeParticle(5000+i, 15.+4.*i, 5., 95.));
  //the file order should not matter
  reverse(particles.begin(), particles.end());
}

TEST_CASE("halos are found in snapshot files and linked across snapshots", "[pipeline]")
{
  ResetTestConfig(100., true);
  string dir=MakeScratchDir("pipeline");
  MEGAConfig.DataPath=dir+"inputs/";
  MEGAConfig.SnapshotNameList={"000", "001"};
  MEGAConfig.MaxSnapshotIndex=1;
  vector <double> redshifts={0.5, 0.};
  for(int isnap=0;isnap<2;isnap++)
  {
	vector <Particle_t> particles;
	MakeSnapshotParticles(isnap, particles);
	WriteInputSnapshot(ParticleSnapshot_t::GetFileName(MEGAConfig.GetSnapshotName(isnap)), particles, redshifts[isnap]);
  }

  MpiWorker_t world(MPI_COMM_SELF);
  HaloSnapshot_t catalogs[2];
  for(int isnap=0;isnap<2;isnap++)
  {
	ParticleSnapshot_t partsnap;
	partsnap.Load(world, isnap);
	REQUIRE(partsnap.size()==(isnap?236:209));
	CHECK(partsnap.Cosmology.Redshift==Approx(redshifts[isnap]));
	CHECK(partsnap.LinkingLength()==Approx(0.5));
	CHECK(MEGAConfig.BoxSize==Approx(100.));

	HaloFinder_t finder;
	Timer_t timer;
	finder.Find(world, partsnap, isnap?&catalogs[0]:nullptr, catalogs[isnap], timer);
	CHECK(timer.Size()==5);
	CHECK(finder.Stats.NumSplit==0);
	CHECK(finder.Stats.NumDropped==0);
	catalogs[isnap].FillParticleHash();
  }

  auto &first=catalogs[0], &second=catalogs[1];
  CHECK(first.SnapshotIndex==0);
  CHECK(second.SnapshotName=="001");
  REQUIRE(first.size()==2);
  REQUIRE(second.size()==3);
  CHECK(first.Halos[0].Nparticles==125);
  CHECK(first.Halos[0].MinParticleId()==0);
  CHECK(first.Halos[1].Nparticles==64);
  CHECK(second.Halos[2].Nparticles==27);
  CHECK(second.Halos[2].MinParticleId()==2000);
  for(auto &&h: second.Halos)
	CHECK(h.GlobalId==GetGlobalHaloId(1, h.HaloId));
  //the clump across the boundary has its centre near x=0.5 after the wrap
  MEGAReal x=second.Halos[0].ComovingAveragePosition[0];
  CHECK(min(x, (MEGAReal)(100.-x))==Approx(0.5).margin(1e-3));

  vector <DirectLink_t> links;
  HaloLinker_t::LinkSerial(first, second, links);
  REQUIRE(links.size()==2);
  CHECK(links[0].ProgenitorId==0);
  CHECK(links[0].DescendantId==0);
  CHECK(links[0].SharedParticles==125);
  CHECK(links[1].ProgenitorId==1);
  CHECK(links[1].DescendantId==1);
  CHECK(links[1].SharedParticles==64);

  MergerGraph_t graph;
  graph.AddSnapshot(0, {125, 64});
  graph.AddSnapshot(1, {125, 64, 27});
  graph.AddLinks(0, 1, links);
  CHECK(graph.IdentifyGraphs()==3);
  CHECK(graph.GetNode(GetGlobalHaloId(1, 2)).Progenitors.empty());
}
