#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include "config_parser.h"
#include "stage_graph.h"

static string MakeConfig(const string &flags, const string &extra_parameters="")
{
  return
	"inputs:\n"
	"  data: /tmp/mega/data/\n"
	"  snapList: /tmp/mega/snaps.txt\n"
	"  haloSavePath: /tmp/mega/halos/\n"
	"  directgraphSavePath: /tmp/mega/graphdirect/\n"
	"  graphSavePath: /tmp/mega/graph/\n"
	"  treehaloSavePath: /tmp/mega/treehalos/\n"
	"  directtreeSavePath: /tmp/mega/treedirect/\n"
	"  treeSavePath: /tmp/mega/tree/\n"
	"cosmology:\n"
	"  H0: 67.7\n"
	"  Om0: 0.31\n"
	"  Ob0: 0.048\n"
	"  Tcmb0: 2.725\n"
	"flags:\n"+flags+
	"parameters:\n"
	"  batchsize: 2000\n"
	"  ini_alpha_v: 2.5\n"
	"  min_alpha_v: 0.2\n"
	"  llcoeff: 0.2\n"
	"  sub_llcoeff: 0.1\n"
	"  decrement: 0.05\n"
	"  part_threshold: 20\n"
	"  N_cells: 50\n"+extra_parameters;
}

static const string FullChain=
  "  halo: 1\n  subs: 1\n  graphdirect: 1\n  subgraphdirect: 1\n  graph: 1\n  subgraph: 1\n"
  "  treehalos: 1\n  treedirect: 1\n  tree: 1\n  useserial: 1\n  usempi: 0\n";

TEST_CASE("a consistent configuration is accepted", "[config]")
{
  Parameter_t config;
  REQUIRE_NOTHROW(config.ParseConfigNode(YAML::Load(MakeConfig(FullChain))));
  CHECK(config.StageEnabled(StageTree));
  CHECK(config.StageEnabled(StageSubs));
  CHECK(config.UseSerial);
  CHECK(config.BatchSize==2000);
  CHECK(config.IniAlphaV==Approx(2.5));
  CHECK(config.MaxSampleSizeOfPotentialEstimate==1000);
  CHECK(config.MinNumPartOfProvisionalHalo==2);
  CHECK(config.PeriodicBoundaryOn);
  CHECK(config.HubbleParameter(0.)==Approx(67.7));
}

TEST_CASE("tree without treedirect is rejected", "[config]")
{
  Parameter_t config;
  string flags="  halo: 1\n  subs: 1\n  graphdirect: 1\n  subgraphdirect: 1\n  graph: 1\n  subgraph: 1\n"
	"  treehalos: 1\n  treedirect: 0\n  tree: 1\n  useserial: 1\n";
  CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(MakeConfig(flags))), ConfigError_t);
}

TEST_CASE("every stage requires all the stages before it", "[config]")
{
  vector <bool> enabled(StageMax, false);
  StageGraph_t stages;
  enabled[StageHalo]=true;
  CHECK_NOTHROW(stages.Validate(enabled));

  SECTION("graphdirect without subs")
  {
	enabled[StageGraphDirect]=true;
	CHECK_THROWS_AS(stages.Validate(enabled), ConfigError_t);
	enabled[StageSubs]=true;
	CHECK_NOTHROW(stages.Validate(enabled));
  }
  SECTION("graph without the stages between it and halo")
  {
	enabled[StageGraph]=true;
	CHECK_THROWS_AS(stages.Validate(enabled), ConfigError_t);
	enabled[StageSubs]=enabled[StageGraphDirect]=true;
	CHECK_THROWS_AS(stages.Validate(enabled), ConfigError_t);
	enabled[StageSubGraphDirect]=true;
	CHECK_NOTHROW(stages.Validate(enabled));
  }
  SECTION("a gap anywhere in the chain")
  {
	enabled.assign(StageMax, true);
	CHECK_NOTHROW(stages.Validate(enabled));
	for(int s=0;s<StageMax-1;s++)
	{
	  enabled[s]=false;
	  CHECK_THROWS_AS(stages.Validate(enabled), ConfigError_t);
	  enabled[s]=true;
	}
  }
}

TEST_CASE("graphdirect in a parameter file without subs is rejected", "[config]")
{
  Parameter_t config;
  string flags="  halo: 1\n  subs: 0\n  graphdirect: 1\n  useserial: 1\n";
  CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(MakeConfig(flags))), ConfigError_t);
}

TEST_CASE("subhalo stages are accepted but reported as unsupported", "[config]")
{
  vector <bool> enabled(StageMax, false);
  enabled[StageHalo]=enabled[StageSubs]=enabled[StageGraphDirect]=enabled[StageSubGraphDirect]=true;
  StageGraph_t stages;
  REQUIRE_NOTHROW(stages.Validate(enabled));
  auto unsupported=stages.UnsupportedStages(enabled);
  REQUIRE(unsupported.size()==2);
  CHECK(unsupported[0]==StageSubs);
  CHECK(unsupported[1]==StageSubGraphDirect);

  enabled[StageSubs]=false;
  CHECK_THROWS_AS(stages.Validate(enabled), ConfigError_t);
}

TEST_CASE("exactly one execution mode must be chosen", "[config]")
{
  Parameter_t both, none;
  CHECK_THROWS_AS(both.ParseConfigNode(YAML::Load(MakeConfig("  halo: 1\n  useserial: 1\n  usempi: 1\n"))), ConfigError_t);
  CHECK_THROWS_AS(none.ParseConfigNode(YAML::Load(MakeConfig("  halo: 1\n  useserial: 0\n  usempi: 0\n"))), ConfigError_t);
}

TEST_CASE("malformed configurations are rejected", "[config]")
{
  SECTION("unknown key")
  {
	Parameter_t config;
	CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(MakeConfig(FullChain, "  no_such_key: 3\n"))), ConfigError_t);
  }
  SECTION("missing compulsory key")
  {
	Parameter_t config;
	string text=MakeConfig(FullChain);
	text.replace(text.find("  N_cells: 50\n"), 14, "");
	CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(text)), ConfigError_t);
  }
  SECTION("non-positive decrement")
  {
	Parameter_t config;
	string text=MakeConfig(FullChain);
	text.replace(text.find("decrement: 0.05"), 15, "decrement: 0");
	CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(text)), ConfigError_t);
  }
  SECTION("alpha schedule running upwards")
  {
	Parameter_t config;
	string text=MakeConfig(FullChain);
	text.replace(text.find("min_alpha_v: 0.2"), 16, "min_alpha_v: 3.0");
	CHECK_THROWS_AS(config.ParseConfigNode(YAML::Load(text)), ConfigError_t);
  }
}
