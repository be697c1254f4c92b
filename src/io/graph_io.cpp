#include <iostream>
#include <string>

#include "../mymath.h"
#include "../config_parser.h"
#include "../merger_graph.h"
#include "../halo.h"
#include "../hdf_wrapper.h"

static void WriteIntColumn(hid_t file, const char *name, const vector <MEGAInt> &data)
{
  hsize_t dims[1]={(hsize_t)data.size()};
  writeHDFmatrix(file, data.data(), name, 1, dims, H5T_MEGAInt);
}

void MergerGraph_t::Save(const string &filename) const
/*node arrays in (graph, snapshot, halo) order, with the edges flattened in the same order*/
{
  vector <MEGAInt> order;
  GetSaveOrder(order);
  MEGAInt nnodes=order.size();

  vector <MEGAInt> GlobalIds(nnodes), Snapshots(nnodes), HaloIds(nnodes), Nparts(nnodes), SplitFroms(nnodes), GraphIds(nnodes);
  vector <MEGAInt> NumProgs(nnodes), ProgStart(nnodes), NumDescs(nnodes), DescStart(nnodes);
  vector <MEGAInt> ProgIds, ProgWeights, DescIds, DescWeights;
  vector <MEGAInt> GraphLengths(NumberOfGraphs, 0), GraphOffsets(NumberOfGraphs, -1);
  for(MEGAInt i=0;i<nnodes;i++)
  {
	auto &node=Nodes[order[i]];
	GlobalIds[i]=node.GlobalId;
	Snapshots[i]=node.SnapshotIndex;
	HaloIds[i]=node.HaloId;
	Nparts[i]=node.Nparticles;
	SplitFroms[i]=node.SplitFrom;
	GraphIds[i]=node.GraphId;
	NumProgs[i]=node.Progenitors.size();
	ProgStart[i]=ProgIds.size();
	for(auto &&e: node.Progenitors)
	{
	  ProgIds.push_back(e.GlobalId);
	  ProgWeights.push_back(e.Weight);
	}
	NumDescs[i]=node.Descendants.size();
	DescStart[i]=DescIds.size();
	for(auto &&e: node.Descendants)
	{
	  DescIds.push_back(e.GlobalId);
	  DescWeights.push_back(e.Weight);
	}
	if(node.GraphId>=0)
	{
	  if(GraphOffsets[node.GraphId]<0) GraphOffsets[node.GraphId]=i;
	  GraphLengths[node.GraphId]++;
	}
  }

  mkdir_for_path(filename);
  hid_t file=CreateHDFFile(filename);
  SetAttribute(file, "nhalos", H5T_MEGAInt, &nnodes);
  SetAttribute(file, "ngraphs", H5T_MEGAInt, &NumberOfGraphs);
  SetAttribute(file, "first_snapshot_index", H5T_NATIVE_INT, &FirstSnapshot);
  SetAttribute(file, "last_snapshot_index", H5T_NATIVE_INT, &LastSnapshot);
  WriteIntColumn(file, "graph_lengths", GraphLengths);
  WriteIntColumn(file, "graph_offsets", GraphOffsets);
  WriteIntColumn(file, "graph_ids", GraphIds);
  WriteIntColumn(file, "halo_global_ids", GlobalIds);
  WriteIntColumn(file, "halo_ids", HaloIds);
  WriteIntColumn(file, "snapshots", Snapshots);
  WriteIntColumn(file, "nparts", Nparts);
  WriteIntColumn(file, "split_from", SplitFroms);
  WriteIntColumn(file, "nprogs", NumProgs);
  WriteIntColumn(file, "prog_start_index", ProgStart);
  WriteIntColumn(file, "progenitors", ProgIds);
  WriteIntColumn(file, "progenitor_weights", ProgWeights);
  WriteIntColumn(file, "ndescs", NumDescs);
  WriteIntColumn(file, "desc_start_index", DescStart);
  WriteIntColumn(file, "descendants", DescIds);
  WriteIntColumn(file, "descendant_weights", DescWeights);
  H5Fclose(file);
}

void MergerGraph_t::BuildFromCatalogs(int first_snapshot, int last_snapshot)
/*read the halo catalogs and the direct links saved by the earlier stages*/
{
  Nodes.clear();
  NumberOfGraphs=0;
  FirstSnapshot=LastSnapshot=SpecialConst::NullSnapshotId;
  for(int isnap=first_snapshot;isnap<=last_snapshot;isnap++)
  {
	string snapname=MEGAConfig.GetSnapshotName(isnap);
	HaloSnapshot_t catalog;
	catalog.ReadFile(HaloSnapshot_t::GetFileName(MEGAConfig.HaloSavePath, "halos", snapname), false);
	vector <MEGAInt> nparticles(catalog.size());
	for(MEGAInt i=0;i<catalog.size();i++)
	{
	  if(catalog.Halos[i].HaloId!=i)
		throw runtime_error("halo ids are not contiguous in the catalog of snapshot "+snapname);
	  nparticles[i]=catalog.Halos[i].Nparticles;
	}
	AddSnapshot(isnap, nparticles);
  }
  FillNodeHash();

  for(int isnap=first_snapshot+1;isnap<=last_snapshot;isnap++)
  {
	string snapname=MEGAConfig.GetSnapshotName(isnap);
	int prog_snap, desc_snap;
	vector <DirectLink_t> links;
	HaloLinker_t::LoadLinks(HaloLinker_t::GetFileName(MEGAConfig.DirectGraphSavePath, "Mgraph", snapname), prog_snap, desc_snap, links);
	if(prog_snap!=isnap-1||desc_snap!=isnap)
	  throw runtime_error("link file of snapshot "+snapname+" does not connect it to the previous snapshot");
	AddLinks(prog_snap, desc_snap, links);
  }
  IdentifyGraphs();
}
