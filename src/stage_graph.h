#ifndef STAGE_GRAPH_H_INCLUDED
#define STAGE_GRAPH_H_INCLUDED

#include <string>
#include <vector>
#include <stdexcept>

using namespace std;

class ConfigError_t: public runtime_error
{
public:
  ConfigError_t(const string &msg): runtime_error(msg)
  {
  }
};

/*pipeline stages in the order they run. do not reorder; the values index the flag list.*/
enum Stage_t: int
{
  StageHalo=0,
  StageSubs,
  StageGraphDirect,
  StageSubGraphDirect,
  StageGraph,
  StageSubGraph,
  StageTreeHalos,
  StageTreeDirect,
  StageTree,
  StageMax
};

class StageGraph_t
/*explicit dependency graph between the stage-enable flags.
 * a stage may only be enabled when every stage before it in Stage_t order is enabled.*/
{
  vector <vector <Stage_t> > Dependencies;
public:
  StageGraph_t();
  static const char * Name(Stage_t stage);
  static bool IsImplemented(Stage_t stage);
  const vector <Stage_t> & DependenciesOf(Stage_t stage) const
  {
	return Dependencies[stage];
  }
  void Validate(const vector <bool> &enabled) const;
  vector <Stage_t> UnsupportedStages(const vector <bool> &enabled) const;
};

#endif
