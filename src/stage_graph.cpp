#include <sstream>

#include "stage_graph.h"

StageGraph_t::StageGraph_t(): Dependencies(StageMax)
/*strict cascade: every stage requires all the stages before it*/
{
  for(int s=1;s<StageMax;s++)
	for(int dep=0;dep<s;dep++)
	  Dependencies[s].push_back(static_cast<Stage_t>(dep));
}

const char * StageGraph_t::Name(Stage_t stage)
{
  static const char * names[StageMax]={"halo", "subs", "graphdirect", "subgraphdirect", "graph", "subgraph", "treehalos", "treedirect", "tree"};
  return names[stage];
}

bool StageGraph_t::IsImplemented(Stage_t stage)
{
  return !(stage==StageSubs||stage==StageSubGraphDirect||stage==StageSubGraph);
}

void StageGraph_t::Validate(const vector <bool> &enabled) const
/*reject any enabled stage with a disabled prerequisite*/
{
  if(enabled.size()!=StageMax)
	throw ConfigError_t("stage flag list has the wrong size");
  for(int s=0;s<StageMax;s++)
  {
	if(!enabled[s]) continue;
	for(auto &&dep: Dependencies[s])
	  if(!enabled[dep])
	  {
		ostringstream msg;
		msg<<"inconsistent stage flags: '"<<Name(static_cast<Stage_t>(s))<<"' is enabled but its prerequisite '"<<Name(dep)<<"' is disabled";
		throw ConfigError_t(msg.str());
	  }
  }
}

vector <Stage_t> StageGraph_t::UnsupportedStages(const vector <bool> &enabled) const
{
  vector <Stage_t> stages;
  for(int s=0;s<StageMax;s++)
	if(enabled[s]&&!IsImplemented(static_cast<Stage_t>(s)))
	  stages.push_back(static_cast<Stage_t>(s));
  return stages;
}
