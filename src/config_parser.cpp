#include <cstdlib>
#include "config_parser.h"

Parameter_t MEGAConfig;

static const char * CompulsaryConfigEntries[NumberOfCompulsaryConfigEntries]={"inputs:data", "inputs:snapList", "inputs:haloSavePath", "cosmology:H0", "cosmology:Om0", "parameters:batchsize", "parameters:ini_alpha_v", "parameters:min_alpha_v", "parameters:llcoeff", "parameters:sub_llcoeff", "parameters:decrement", "parameters:part_threshold", "parameters:N_cells", "flags:halo"};

void Parameter_t::SetParameterValue(const string &section, const string &name, const YAML::Node &value)
{
#define TrySetPar(key,var,i) if(name==key){ var=value.as<decltype(var)>(); IsSet[i]=true;}
#define TrySetOpt(key,var) if(name==key) var=value.as<decltype(var)>();
#define TrySetFlag(key,var) if(name==key) var=(value.as<int>()!=0);
  bool recognized=true;
  if(section=="inputs")
  {
	TrySetPar("data", DataPath, 0)
	else TrySetPar("snapList", SnapshotListFile, 1)
	else TrySetPar("haloSavePath", HaloSavePath, 2)
	else TrySetOpt("directgraphSavePath", DirectGraphSavePath)
	else TrySetOpt("graphSavePath", GraphSavePath)
	else TrySetOpt("treehaloSavePath", TreeHaloSavePath)
	else TrySetOpt("directtreeSavePath", DirectTreeSavePath)
	else TrySetOpt("treeSavePath", TreeSavePath)
	else TrySetOpt("profilingPath", ProfilingPath)
	else TrySetOpt("analyticPlotPath", AnalyticPlotPath)
	else recognized=false;
  }
  else if(section=="cosmology")
  {
	TrySetPar("H0", H0, 3)
	else TrySetPar("Om0", OmegaM0, 4)
	else TrySetOpt("Ob0", OmegaB0)
	else TrySetOpt("Tcmb0", Tcmb0)
	else recognized=false;
  }
  else if(section=="parameters")
  {
	TrySetPar("batchsize", BatchSize, 5)
	else TrySetPar("ini_alpha_v", IniAlphaV, 6)
	else TrySetPar("min_alpha_v", MinAlphaV, 7)
	else TrySetPar("llcoeff", LinkCoeff, 8)
	else TrySetPar("sub_llcoeff", SubLinkCoeff, 9)
	else TrySetPar("decrement", AlphaDecrement, 10)
	else TrySetPar("part_threshold", PartThreshold, 11)
	else TrySetPar("N_cells", NumberOfCells, 12)
	else TrySetFlag("PeriodicBoundaryOn", PeriodicBoundaryOn)
	else TrySetOpt("MaxSampleSizeOfPotentialEstimate", MaxSampleSizeOfPotentialEstimate)
	else TrySetOpt("MinNumPartOfProvisionalHalo", MinNumPartOfProvisionalHalo)
	else TrySetOpt("MaxConcurrentIO", MaxConcurrentIO)
	else recognized=false;
  }
  else if(section=="flags")
  {
	TrySetFlag("useserial", UseSerial)
	else TrySetFlag("usempi", UseMPI)
	else TrySetFlag("verbose", Verbose)
	else TrySetFlag("profile", Profile)
	else
	{
	  for(int s=0;s<StageMax;s++)
		if(name==StageGraph_t::Name(static_cast<Stage_t>(s)))
		{
		  StageFlags[s]=(value.as<int>()!=0);
		  if(StageHalo==s) IsSet[13]=true;
		  return;
		}
	  recognized=false;
	}
  }
#undef TrySetPar
#undef TrySetOpt
#undef TrySetFlag
  if(!recognized)
  {
	stringstream msg;
	msg<<"unrecognized configuration entry: "<<section<<":"<<name<<endl;
	throw ConfigError_t(msg.str());
  }
}

void Parameter_t::ParseConfigNode(const YAML::Node &root)
{
  if(!root.IsMap())
	throw ConfigError_t("configuration is not a map of sections");
  const char * sections[]={"inputs", "cosmology", "flags", "parameters"};
  for(auto section: sections)
  {
	YAML::Node node=root[section];
	if(!node) continue;
	for(YAML::const_iterator it=node.begin();it!=node.end();++it)
	{
	  string name=it->first.as<string>();
	  try
	  {
		SetParameterValue(section, name, it->second);
	  }
	  catch(const YAML::BadConversion &e)
	  {
		throw ConfigError_t("invalid value for "+string(section)+":"+name+": "+e.what());
	  }
	}
  }
  CheckUnsetParameters();
  CheckConsistency();
}

void Parameter_t::ParseConfigFile(const char * param_file)
{
  cout<<"Reading configuration file "<<param_file<<endl;

  YAML::Node root;
  try
  {
	root=YAML::LoadFile(param_file);
  }
  catch(const YAML::Exception &e)
  {
	throw ConfigError_t(string("failed to read configuration ")+param_file+": "+e.what());
  }
  ParseConfigNode(root);
  ReadSnapshotNameList();
}

void Parameter_t::ReadSnapshotNameList()
{//one snapshot name per line; '#' starts a comment.
  ifstream ifs;
  ifs.open(SnapshotListFile);
  if(!ifs.is_open())
	throw ConfigError_t("failed to open snapshot list "+SnapshotListFile);

  SnapshotNameList.clear();
  string line;
  while(getline(ifs,line))
  {
	trim_trailing_garbage(line, "#");
	istringstream ss(line);
	string name;
	ss>>name;
	if(!name.empty())
	  SnapshotNameList.push_back(name);
  }
  if(SnapshotNameList.empty())
	throw ConfigError_t("empty snapshot list "+SnapshotListFile);
  MaxSnapshotIndex=SnapshotNameList.size()-1;
  cout<<"Found "<<SnapshotNameList.size()<<" snapshots in "<<SnapshotListFile<<endl;
}

void Parameter_t::CheckUnsetParameters()
{
  for(int i=0;i<IsSet.size();i++)
  {
	if(!IsSet[i])
	  throw ConfigError_t(string("Error parsing configuration file: entry ")+CompulsaryConfigEntries[i]+" missing");
  }
  if(StageFlags[StageGraphDirect]&&DirectGraphSavePath.empty())
	throw ConfigError_t("graphdirect is enabled but inputs:directgraphSavePath is missing");
  if(StageFlags[StageGraph]&&GraphSavePath.empty())
	throw ConfigError_t("graph is enabled but inputs:graphSavePath is missing");
  if(StageFlags[StageTreeHalos]&&TreeHaloSavePath.empty())
	throw ConfigError_t("treehalos is enabled but inputs:treehaloSavePath is missing");
  if(StageFlags[StageTreeDirect]&&DirectTreeSavePath.empty())
	throw ConfigError_t("treedirect is enabled but inputs:directtreeSavePath is missing");
  if(StageFlags[StageTree]&&TreeSavePath.empty())
	throw ConfigError_t("tree is enabled but inputs:treeSavePath is missing");
  if(Profile&&ProfilingPath.empty())
	throw ConfigError_t("profile is enabled but inputs:profilingPath is missing");
}

void Parameter_t::CheckConsistency()
/*everything that can be rejected before any compute resource is allocated*/
{
  StageGraph_t stages;
  stages.Validate(StageFlags);

  if(UseSerial==UseMPI)
	throw ConfigError_t("exactly one of flags:useserial and flags:usempi must be enabled");

  if(!(AlphaDecrement>0))
	throw ConfigError_t("parameters:decrement must be positive");
  if(IniAlphaV<MinAlphaV)
	throw ConfigError_t("parameters:ini_alpha_v must not be smaller than parameters:min_alpha_v");
  if(!(LinkCoeff>0)||!(SubLinkCoeff>0))
	throw ConfigError_t("linking length coefficients must be positive");
  if(BatchSize<=0)
	throw ConfigError_t("parameters:batchsize must be positive");
  if(NumberOfCells<=0)
	throw ConfigError_t("parameters:N_cells must be positive");
  if(PartThreshold<1)
	throw ConfigError_t("parameters:part_threshold must be at least 1");
  if(MinNumPartOfProvisionalHalo<2)
	throw ConfigError_t("parameters:MinNumPartOfProvisionalHalo must be at least 2");
  if(MaxConcurrentIO<1)
	throw ConfigError_t("parameters:MaxConcurrentIO must be positive");
}

void ParseMEGAParams(int argc, char **argv, Parameter_t &config, int &snapshot_start, int &snapshot_end)
{
  if(argc<2)
	throw ConfigError_t(string("Usage: ")+argv[0]+" [param_file] <snapshot_start> <snapshot_end>");
  config.ParseConfigFile(argv[1]);
  if(2==argc)
  {
	snapshot_start=0;
	snapshot_end=config.MaxSnapshotIndex;
  }
  else
  {
  snapshot_start=atoi(argv[2]);
  if(argc>3)
	snapshot_end=atoi(argv[3]);
  else
	snapshot_end=snapshot_start;
  }
  if(snapshot_start<0||snapshot_end>config.MaxSnapshotIndex||snapshot_start>snapshot_end)
  {
	stringstream msg;
	msg<<"invalid snapshot range ["<<snapshot_start<<", "<<snapshot_end<<"] for "<<config.MaxSnapshotIndex+1<<" snapshots";
	throw ConfigError_t(msg.str());
  }
  cout<<"Running "<<argv[0]<<" from snapshot "<<snapshot_start<<" to "<<snapshot_end<<" using configuration file "<<argv[1]<<endl;
}

void Parameter_t::BroadCast(MpiWorker_t &world, int root)
/*sync parameters across*/
{
  #define _SyncVec(x,t) world.SyncContainer(x,t,root)
  #define _SyncAtom(x,t) world.SyncAtom(x,t,root)
  #define _SyncBool(x) world.SyncAtomBool(x, root)
  #define _SyncVecBool(x) world.SyncVectorBool(x, root)
  #define _SyncReal(x) _SyncAtom(x, MPI_MEGA_REAL)
  #define _SyncInt(x) _SyncAtom(x, MPI_MEGA_INT)

  _SyncVec(DataPath, MPI_CHAR);
  _SyncVec(SnapshotListFile, MPI_CHAR);
  _SyncVec(HaloSavePath, MPI_CHAR);
  _SyncReal(H0);
  _SyncReal(OmegaM0);
  _SyncInt(BatchSize);
  _SyncReal(IniAlphaV);
  _SyncReal(MinAlphaV);
  _SyncReal(LinkCoeff);
  _SyncReal(SubLinkCoeff);
  _SyncReal(AlphaDecrement);
  _SyncInt(PartThreshold);
  _SyncInt(NumberOfCells);
  _SyncVecBool(StageFlags);
  _SyncVecBool(IsSet);

  _SyncVec(DirectGraphSavePath, MPI_CHAR);
  _SyncVec(GraphSavePath, MPI_CHAR);
  _SyncVec(TreeHaloSavePath, MPI_CHAR);
  _SyncVec(DirectTreeSavePath, MPI_CHAR);
  _SyncVec(TreeSavePath, MPI_CHAR);
  _SyncVec(ProfilingPath, MPI_CHAR);
  _SyncVec(AnalyticPlotPath, MPI_CHAR);
  _SyncReal(OmegaB0);
  _SyncReal(Tcmb0);
  _SyncBool(UseSerial);
  _SyncBool(UseMPI);
  _SyncBool(Verbose);
  _SyncBool(Profile);
  _SyncBool(PeriodicBoundaryOn);
  _SyncInt(MaxSampleSizeOfPotentialEstimate);
  _SyncInt(MinNumPartOfProvisionalHalo);
  _SyncAtom(MaxConcurrentIO, MPI_INT);

  world.SyncVectorString(SnapshotNameList, root);
  _SyncAtom(MaxSnapshotIndex, MPI_INT);
  _SyncReal(BoxSize);
  _SyncReal(BoxHalf);
  //---------------end sync params-------------------------//

  #undef _SyncVec
  #undef _SyncAtom
  #undef _SyncBool
  #undef _SyncVecBool
  #undef _SyncReal
  #undef _SyncInt
}

void Parameter_t::DumpParameters()
/*write the effective configuration as a yaml parameter file that can be fed back to MEGA*/
{
  mkdir_for_path(HaloSavePath);
  string filename=HaloSavePath+"VER"+MEGA_VERSION+".param";
  ofstream version_file(filename, ios::out|ios::trunc);
  if(!version_file.is_open())
	throw runtime_error("Error opening "+filename+" for parameter dump.");

  YAML::Emitter out;
  out<<YAML::BeginMap;
#define DumpPar(key, var) out<<YAML::Key<<key<<YAML::Value<<var;
#define DumpFlag(key, var) out<<YAML::Key<<key<<YAML::Value<<(int)(var);
  out<<YAML::Key<<"inputs"<<YAML::Value<<YAML::BeginMap;
  DumpPar("data", DataPath)
  DumpPar("snapList", SnapshotListFile)
  DumpPar("haloSavePath", HaloSavePath)
  DumpPar("directgraphSavePath", DirectGraphSavePath)
  DumpPar("graphSavePath", GraphSavePath)
  DumpPar("treehaloSavePath", TreeHaloSavePath)
  DumpPar("directtreeSavePath", DirectTreeSavePath)
  DumpPar("treeSavePath", TreeSavePath)
  DumpPar("profilingPath", ProfilingPath)
  DumpPar("analyticPlotPath", AnalyticPlotPath)
  out<<YAML::EndMap;

  out<<YAML::Key<<"cosmology"<<YAML::Value<<YAML::BeginMap;
  DumpPar("H0", H0)
  DumpPar("Om0", OmegaM0)
  DumpPar("Ob0", OmegaB0)
  DumpPar("Tcmb0", Tcmb0)
  out<<YAML::EndMap;

  out<<YAML::Key<<"flags"<<YAML::Value<<YAML::BeginMap;
  for(int s=0;s<StageMax;s++)
	DumpFlag(StageGraph_t::Name(static_cast<Stage_t>(s)), StageFlags[s])
  DumpFlag("useserial", UseSerial)
  DumpFlag("usempi", UseMPI)
  DumpFlag("verbose", Verbose)
  DumpFlag("profile", Profile)
  out<<YAML::EndMap;

  out<<YAML::Key<<"parameters"<<YAML::Value<<YAML::BeginMap;
  DumpPar("batchsize", BatchSize)
  DumpPar("ini_alpha_v", IniAlphaV)
  DumpPar("min_alpha_v", MinAlphaV)
  DumpPar("llcoeff", LinkCoeff)
  DumpPar("sub_llcoeff", SubLinkCoeff)
  DumpPar("decrement", AlphaDecrement)
  DumpPar("part_threshold", PartThreshold)
  DumpPar("N_cells", NumberOfCells)
  DumpFlag("PeriodicBoundaryOn", PeriodicBoundaryOn)
  DumpPar("MaxSampleSizeOfPotentialEstimate", MaxSampleSizeOfPotentialEstimate)
  DumpPar("MinNumPartOfProvisionalHalo", MinNumPartOfProvisionalHalo)
  DumpPar("MaxConcurrentIO", MaxConcurrentIO)
  out<<YAML::EndMap;
#undef DumpPar
#undef DumpFlag
  out<<YAML::EndMap;

  version_file<<"# MEGA "<<MEGA_VERSION<<endl;
  version_file<<out.c_str()<<endl;
  version_file.close();
}

string Parameter_t::GetSnapshotName(int isnap) const
{
  if(isnap<0||isnap>=(int)SnapshotNameList.size())
  {
	stringstream msg;
	msg<<"snapshot index "<<isnap<<" out of range [0, "<<SnapshotNameList.size()<<")";
	throw out_of_range(msg.str());
  }
  return SnapshotNameList[isnap];
}

MEGAReal Parameter_t::HubbleParameter(MEGAReal redshift) const
/*flat LCDM Hubble parameter in km/s/Mpc*/
{
  double a=1./(1.+redshift);
  return H0*sqrt(OmegaM0/(a*a*a)+(1.-OmegaM0));
}
