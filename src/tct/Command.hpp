#ifndef TCT_COMMAND_H_
#define TCT_COMMAND_H_

#include <optional>
#include <string>
#include <vector>

#include "Commitment.hpp"
#include "Tree.hpp"

namespace libtct {

//! Throws std::runtime_error unless `str` is a position ("e/b/c" or a leaf index).
Position ParsePosition(const std::string& str);
//! Throws std::runtime_error unless `str` is a hex-encoded commitment.
Commitment ParseCommitment(const std::string& str);

/**
 * Position named by `str`: a hex commitment is looked up in the tree's index
 * (nothing if it is not there), anything else must parse as a position.
 */
std::optional<Position> ResolvePosition(const CommitmentTree& tree, const std::string& str);

/**
 * Run one tool command (`args[0]`, followed by its arguments) against `tree`,
 * appending what it prints to `strOutput`. Returns true if the tree changed
 * and needs to be stored again. Unknown commands, wrong argument counts and
 * rejected insertions throw std::runtime_error.
 */
bool RunCommand(CommitmentTree& tree, const std::vector<std::string>& args, std::string& strOutput);

}

#endif // TCT_COMMAND_H_
