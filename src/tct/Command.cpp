#include "Command.hpp"

#include <stdexcept>

#include "logging.h"

namespace libtct {

Position ParsePosition(const std::string& str)
{
    std::optional<Position> position = Position::FromString(str);
    if (!position) {
        throw std::runtime_error("invalid position '" + str + "'");
    }
    return *position;
}

Commitment ParseCommitment(const std::string& str)
{
    std::optional<Commitment> commitment = Commitment::FromHex(str);
    if (!commitment) {
        throw std::runtime_error(tfm::format("invalid commitment '%s', expected %d hex digits",
                                             str, 2 * TCT_COMMITMENT_SIZE));
    }
    return *commitment;
}

std::optional<Position> ResolvePosition(const CommitmentTree& tree, const std::string& str)
{
    std::optional<Commitment> commitment = Commitment::FromHex(str);
    if (commitment) {
        return tree.position_of(*commitment);
    }
    return ParsePosition(str);
}

static void RequireArgs(const std::vector<std::string>& args, size_t n)
{
    if (args.size() != n + 1) {
        throw std::runtime_error(tfm::format("'%s' takes %d argument(s)", args[0], n));
    }
}

bool RunCommand(CommitmentTree& tree, const std::vector<std::string>& args, std::string& strOutput)
{
    if (args.empty()) {
        throw std::runtime_error("no command given");
    }
    const std::string& strCommand = args[0];

    if (strCommand == "insert") {
        RequireArgs(args, 1);
        auto position = tree.insert(ParseCommitment(args[1]));
        if (!position) {
            throw std::runtime_error(InsertErrorString(position.error()));
        }
        strOutput += position->ToString() + "\n";
        return true;
    }
    if (strCommand == "end-block" || strCommand == "end-epoch") {
        RequireArgs(args, 0);
        auto ended = strCommand == "end-block" ? tree.end_block() : tree.end_epoch();
        if (!ended) {
            throw std::runtime_error(InsertErrorString(ended.error()));
        }
        strOutput += ended->GetHex() + "\n";
        return true;
    }
    if (strCommand == "root") {
        RequireArgs(args, 0);
        strOutput += tree.root().GetHex() + "\n";
        return false;
    }
    if (strCommand == "position") {
        RequireArgs(args, 0);
        auto position = tree.position();
        strOutput += (position ? position->ToString() : "full") + "\n";
        return false;
    }
    if (strCommand == "witness") {
        RequireArgs(args, 1);
        std::optional<Position> position = ResolvePosition(tree, args[1]);
        std::optional<Proof> proof;
        if (position) {
            proof = tree.witness(*position);
        }
        if (!proof) {
            throw std::runtime_error("no witness available for " + args[1]);
        }
        strOutput += "commitment: " + proof->commitment.GetHex() + "\n";
        strOutput += "position: " + proof->position.ToString() + "\n";
        for (size_t i = 0; i < proof->path.depth(); i++) {
            std::string strLevel;
            for (const Hash& sibling : proof->path.levels[i]) {
                strLevel += " " + sibling.GetHex();
            }
            strOutput += tfm::format("level %d:%s\n", i + 1, strLevel);
        }
        strOutput += "root: " + proof->root().GetHex() + "\n";
        strOutput += std::string("valid: ") + (proof->verify(tree.root()) ? "true" : "false") + "\n";
        return false;
    }
    if (strCommand == "forget") {
        RequireArgs(args, 1);
        std::optional<Position> position = ResolvePosition(tree, args[1]);
        bool forgotten = position && tree.forget(*position);
        strOutput += forgotten ? "forgotten\n" : "not found\n";
        return forgotten;
    }
    throw std::runtime_error("unknown command '" + strCommand + "'");
}

}
