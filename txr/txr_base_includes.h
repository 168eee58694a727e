#if !defined TAXRECON_BASE_INCLUDES_H
#define TAXRECON_BASE_INCLUDES_H
#include "txr/assert.hh"
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <functional>
#ifdef __clang__
#pragma clang diagnostic ignored "-Wpadded"
#pragma clang diagnostic ignored  "-Wweak-vtables"
#endif
#if !defined(ELPP_CUSTOM_COUT)
#define ELPP_CUSTOM_COUT std::cerr
#endif
#if !defined(ELPP_THREAD_SAFE)
#define ELPP_THREAD_SAFE 1
#endif
#if !defined(ELPP_STACKTRACE_ON_CRASH)
#define ELPP_STACKTRACE_ON_CRASH 1
#endif

#include <easylogging++.h>
#include <optional>

#define TXR_UNREACHABLE {LOG(ERROR)<<"Unreachable code reached!"; std::abort();}

namespace txr {
extern bool debugging_output_enabled;

// canonical rank levels are 1-based; 0 is "unknown"
using RankLevel = int;
constexpr std::size_t MAX_RANK_LEVELS = 22;
constexpr std::size_t STD_RANK_LEVELS = 7;
constexpr int UNASSIGNED_RANK_LEVEL = -1;

using RankPath = std::vector<std::string>;
using SeqIdSet = std::set<std::string>;
using SeqRanksMap = std::map<std::string, RankPath>;
using RankSeqsMap = std::map<std::string, SeqIdSet>;
// a (position, name) pair used to select clades
using CladeSelector = std::pair<std::size_t, std::string>;

// forward decl
template<typename T> class RootedTreeNode;
template<typename T> class RootedTree;
class RankCodeTable;
class TaxonomyStore;
class TaxTreeBuilder;
struct RTTaxNodeData;

using TaxTreeNode = RootedTreeNode<RTTaxNodeData>;
using TaxTree = RootedTree<RTTaxNodeData>;

} // namespace txr
#endif
