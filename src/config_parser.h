#ifndef CONFIG_PARSER_H_INCLUDED
#define CONFIG_PARSER_H_INCLUDED

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <vector>
#include <cmath>
#include <yaml-cpp/yaml.h>

#include "datatypes.h"
#include "mpi_wrapper.h"
#include "stage_graph.h"

#define MEGA_VERSION "1.0.0.MPI"

namespace PhysicalConst
{
  const double G=1.32712440018e11;//gravitational constant in km^3 s^-2 Msun^-1
  const double MpcInKm=3.086e19;
}

#define NumberOfCompulsaryConfigEntries 14
class Parameter_t
{/*!remember to register members in BroadCast(), SetParameterValue() and DumpParameters() if you change them!*/
public:
  /*compulsory parameters*/
  string DataPath;
  string SnapshotListFile;
  string HaloSavePath;
  MEGAReal H0;
  MEGAReal OmegaM0;
  MEGAInt BatchSize;
  MEGAReal IniAlphaV;
  MEGAReal MinAlphaV;
  MEGAReal LinkCoeff;
  MEGAReal SubLinkCoeff;
  MEGAReal AlphaDecrement;
  MEGAInt PartThreshold;
  MEGAInt NumberOfCells;
  vector <bool> StageFlags;
  vector <bool> IsSet;

  /*optional*/
  string DirectGraphSavePath;
  string GraphSavePath;
  string TreeHaloSavePath;
  string DirectTreeSavePath;
  string TreeSavePath;
  string ProfilingPath;
  string AnalyticPlotPath;
  MEGAReal OmegaB0;
  MEGAReal Tcmb0;
  bool UseSerial;
  bool UseMPI;
  bool Verbose;
  bool Profile;
  bool PeriodicBoundaryOn;
  MEGAInt MaxSampleSizeOfPotentialEstimate;
  MEGAInt MinNumPartOfProvisionalHalo;
  int MaxConcurrentIO;

  /*derived parameters; do not require user input*/
  vector <string> SnapshotNameList;
  int MaxSnapshotIndex;
  MEGAReal BoxSize;//set from the snapshot header
  MEGAReal BoxHalf;

  Parameter_t(): StageFlags(StageMax, false), IsSet(NumberOfCompulsaryConfigEntries, false), SnapshotNameList()
  {
	OmegaB0=0.;
	Tcmb0=0.;
	UseSerial=false;
	UseMPI=false;
	Verbose=false;
	Profile=false;
	PeriodicBoundaryOn=true;
	MaxSampleSizeOfPotentialEstimate=1000;//set to 0 to disable sampling
	MinNumPartOfProvisionalHalo=2;
	MaxConcurrentIO=10;
	MaxSnapshotIndex=-1;
	BoxSize=0.;
	BoxHalf=0.;
  }
  bool StageEnabled(Stage_t stage) const
  {
	return StageFlags[stage];
  }
  void SetBoxSize(MEGAReal boxsize)
  {
	BoxSize=boxsize;
	BoxHalf=boxsize/2.;
  }
  void ReadSnapshotNameList();
  void ParseConfigFile(const char * param_file);
  void ParseConfigNode(const YAML::Node &root);
  void SetParameterValue(const string &section, const string &name, const YAML::Node &value);
  void CheckUnsetParameters();
  void CheckConsistency();
  void BroadCast(MpiWorker_t &world, int root);
  void BroadCast(MpiWorker_t &world, int root, int &snapshot_start, int &snapshot_end)
  {
	BroadCast(world, root);
	world.SyncAtom(snapshot_start, MPI_INT, root);
	world.SyncAtom(snapshot_end, MPI_INT, root);
  }
  void DumpParameters();
  string GetSnapshotName(int isnap) const;
  MEGAReal HubbleParameter(MEGAReal redshift) const;
};

extern Parameter_t MEGAConfig;
extern void ParseMEGAParams(int argc, char **argv, Parameter_t &config, int &snapshot_start, int &snapshot_end);
inline void trim_leading_garbage(string &s, const string &garbage_list)
{
  size_t pos= s.find_first_not_of(garbage_list);//look for any good staff
  if( string::npos!=pos)
	s.erase(0, pos);
  else //no good staff, clear everything
	s.clear();
}
inline void trim_trailing_garbage(string &s, const string &garbage_list)
{
  size_t pos=s.find_first_of(garbage_list);
  if(string::npos!=pos)
	s.erase(pos);
}

#define NEAREST(x) (((x)>MEGAConfig.BoxHalf)?((x)-MEGAConfig.BoxSize):(((x)<-MEGAConfig.BoxHalf)?((x)+MEGAConfig.BoxSize):(x)))
inline MEGAReal PeriodicDistance(const MEGAxyz &x, const MEGAxyz &y)
{
	MEGAxyz dx;
	dx[0]=x[0]-y[0];
	dx[1]=x[1]-y[1];
	dx[2]=x[2]-y[2];
	if(MEGAConfig.PeriodicBoundaryOn)
	{
	  dx[0]=NEAREST(dx[0]);
	  dx[1]=NEAREST(dx[1]);
	  dx[2]=NEAREST(dx[2]);
	}
	return sqrt(dx[0]*dx[0]+dx[1]*dx[1]+dx[2]*dx[2]);
}
#endif
