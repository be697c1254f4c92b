#include <catch2/catch.hpp>

#include "halo.h"
#include "halo_linker.h"
#include "merger_graph.h"
#include "hdf_wrapper.h"
#include "test_helpers.h"

static void ReadIntColumn(hid_t file, const char *name, vector <MEGAInt> &data)
{
  hid_t dset=H5Dopen2(file, name, H5P_DEFAULT);
  REQUIRE(dset>=0);
  hsize_t dims[1];
  GetDatasetDims(dset, dims);
  H5Dclose(dset);
  data.resize(dims[0]);
  if(dims[0])
	REQUIRE(ReadDataset(file, name, H5T_MEGAInt, data.data())>=0);
}

static void WriteTestCatalog(const string &filename, int isnap, const vector <MEGAInt> &sizes, MEGAInt first_id)
{
  HaloSnapshot_t catalog;
  catalog.SnapshotIndex=isnap;
  catalog.SnapshotName=MEGAConfig.GetSnapshotName(isnap);
  catalog.Cosmology.BoxSize=100.;
  catalog.Cosmology.ParticleMass=0.02;
  catalog.Cosmology.HubbleParam=0.7;
  catalog.Cosmology.NumberOfParticlesInAll=4096;
  catalog.Cosmology.MeanSeparation=100./16;
  catalog.Cosmology.Set(1.);
  catalog.LinkingLength=1.25;
  MEGAInt id=first_id;
  for(MEGAInt i=0;i<(MEGAInt)sizes.size();i++)
  {
	catalog.Halos.emplace_back();
	auto &h=catalog.Halos.back();
	h.HaloId=i;
	h.GlobalId=GetGlobalHaloId(isnap, i);
	for(MEGAInt j=0;j<sizes[i];j++)
	  h.Particles.push_back(MakeParticle(id++, 10.*i, 1., 2.));
	h.Nparticles=sizes[i];
	h.Vmax=100.+i;
	h.VelDisp1D[2]=3.5;
  }
  catalog.WriteFile(filename);
}

TEST_CASE("halo catalogs read back what was written", "[io]")
{
  ResetTestConfig(100., true);
  MEGAConfig.SnapshotNameList={"000", "001"};
  string dir=MakeScratchDir("halos");
  string filename=HaloSnapshot_t::GetFileName(dir, "halos", "001");
  WriteTestCatalog(filename, 1, {5, 3, 0}, 40);

  HaloSnapshot_t catalog;
  catalog.ReadFile(filename);
  CHECK(catalog.SnapshotIndex==1);
  CHECK(catalog.SnapshotName=="001");
  CHECK(catalog.Cosmology.Redshift==Approx(1.));
  CHECK(catalog.Cosmology.ScaleFactor==Approx(0.5));
  CHECK(catalog.Cosmology.NumberOfParticlesInAll==4096);
  CHECK(catalog.LinkingLength==Approx(1.25));
  REQUIRE(catalog.size()==3);
  CHECK(catalog.Halos[1].GlobalId==GetGlobalHaloId(1, 1));
  CHECK(catalog.Halos[1].Vmax==Approx(101.));
  CHECK(catalog.Halos[0].VelDisp1D[2]==Approx(3.5));
  REQUIRE(catalog.Halos[0].Particles.size()==5);
  CHECK(catalog.Halos[0].Particles[4].Id==44);
  CHECK(catalog.Halos[1].Particles[0].Id==45);
  CHECK(catalog.Halos[2].Particles.empty());
  CHECK(catalog.CountParticles()==8);

  HaloSnapshot_t header_only;
  header_only.ReadFile(filename, false);
  CHECK(header_only.size()==3);
  CHECK(header_only.Halos[0].Nparticles==5);
  CHECK(header_only.CountParticles()==0);

  MpiWorker_t world(MPI_COMM_SELF);
  HaloSnapshot_t loaded;
  loaded.Load(world, filename);
  CHECK(loaded.TotNumberOfHalos==3);
  loaded.FillParticleHash();
  CHECK(loaded.GetHaloIndex(46)==1);
  CHECK(loaded.GetHaloIndex(48)==SpecialConst::NullHaloId);

  CHECK_THROWS_AS(catalog.ReadFile(dir+"missing.hdf5"), runtime_error);
}

TEST_CASE("direct links read back what was written", "[io]")
{
  string dir=MakeScratchDir("links");
  string filename=HaloLinker_t::GetFileName(dir, "Mgraph", "007");
  CHECK(filename==dir+"Mgraph_007.hdf5");
  vector <DirectLink_t> links={DirectLink_t(0, 0, 12), DirectLink_t(0, 3, 1), DirectLink_t(4, 2, 7)};
  HaloLinker_t::SaveLinks(filename, 6, 7, links);

  int prog_snap, desc_snap;
  vector <DirectLink_t> loaded;
  HaloLinker_t::LoadLinks(filename, prog_snap, desc_snap, loaded);
  CHECK(prog_snap==6);
  CHECK(desc_snap==7);
  REQUIRE(loaded.size()==3);
  CHECK(loaded[2].ProgenitorId==4);
  CHECK(loaded[2].DescendantId==2);
  CHECK(loaded[2].SharedParticles==7);

  HaloLinker_t::SaveLinks(filename, 6, 7, vector <DirectLink_t>());
  HaloLinker_t::LoadLinks(filename, prog_snap, desc_snap, loaded);
  CHECK(loaded.empty());
}

TEST_CASE("the merger graph is assembled from saved catalogs and links", "[io][graph]")
{
  ResetTestConfig(100., true);
  MEGAConfig.SnapshotNameList={"000", "001", "002"};
  MEGAConfig.MaxSnapshotIndex=2;
  string dir=MakeScratchDir("graph");
  MEGAConfig.HaloSavePath=dir+"halos/";
  MEGAConfig.DirectGraphSavePath=dir+"graphdirect/";
  for(int isnap=0;isnap<3;isnap++)
	WriteTestCatalog(HaloSnapshot_t::GetFileName(MEGAConfig.HaloSavePath, "halos", MEGAConfig.GetSnapshotName(isnap)), isnap, {6, 4}, 0);
  HaloLinker_t::SaveLinks(HaloLinker_t::GetFileName(MEGAConfig.DirectGraphSavePath, "Mgraph", "001"), 0, 1, {DirectLink_t(0, 0, 6), DirectLink_t(1, 1, 4)});
  HaloLinker_t::SaveLinks(HaloLinker_t::GetFileName(MEGAConfig.DirectGraphSavePath, "Mgraph", "002"), 1, 2, {DirectLink_t(0, 0, 6), DirectLink_t(1, 0, 4)});

  MergerGraph_t graph;
  graph.BuildFromCatalogs(0, 2);
  CHECK(graph.size()==6);
  CHECK(graph.FirstSnapshot==0);
  CHECK(graph.LastSnapshot==2);
  CHECK(graph.NumberOfGraphs==2);//halo 1 of the last snapshot has no progenitor
  CHECK(graph.GetNode(GetGlobalHaloId(2, 0)).Progenitors.size()==2);

  string filename=dir+"graph/FullMgraphs.hdf5";
  graph.Save(filename);
  hid_t file=OpenHDFFile(filename, H5F_ACC_RDONLY);
  MEGAInt ngraphs=0, nhalos=0;
  CHECK(ReadAttribute(file, ".", "ngraphs", H5T_MEGAInt, &ngraphs)>=0);
  CHECK(ReadAttribute(file, ".", "nhalos", H5T_MEGAInt, &nhalos)>=0);
  CHECK(ngraphs==2);
  CHECK(nhalos==6);
  vector <MEGAInt> graph_ids, snapshots, lengths, offsets, nprogs, progs, weights;
  ReadIntColumn(file, "graph_ids", graph_ids);
  ReadIntColumn(file, "snapshots", snapshots);
  ReadIntColumn(file, "graph_lengths", lengths);
  ReadIntColumn(file, "graph_offsets", offsets);
  ReadIntColumn(file, "nprogs", nprogs);
  ReadIntColumn(file, "progenitors", progs);
  ReadIntColumn(file, "progenitor_weights", weights);
  H5Fclose(file);
  CHECK(graph_ids==vector<MEGAInt>({0, 0, 0, 0, 0, 1}));
  CHECK(snapshots==vector<MEGAInt>({0, 0, 1, 1, 2, 2}));
  CHECK(lengths==vector<MEGAInt>({5, 1}));
  CHECK(offsets==vector<MEGAInt>({0, 5}));
  CHECK(nprogs==vector<MEGAInt>({0, 0, 1, 1, 2, 0}));
  CHECK(progs.size()==4);
  CHECK(weights==vector<MEGAInt>({6, 4, 6, 4}));
}
