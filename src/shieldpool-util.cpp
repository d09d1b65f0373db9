// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "fs.h"
#include "init.h"
#include "logging.h"
#include "shieldpool/Field.hpp"
#include "shieldpool/MerkleTreeState.hpp"
#include "shieldpool/PublicInputs.hpp"
#include "shieldpool/ShieldPool.h"
#include "shieldpool/VerificationKey.hpp"
#include "util/system.h"
#include "utilstrencodings.h"

#include <iterator>
#include <stdio.h>

#include <univalue.h>

using namespace libshieldpool;

static const int CONTINUE_EXECUTION = -1;

/** A field element given as 0x-prefixed big-endian hex or as a decimal integer. */
static uint256 ParseFieldElement(const std::string& str)
{
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        std::string hex = str.substr(2);
        if (!IsHex(hex) || hex.size() > 64)
            throw std::invalid_argument("not a 256-bit hex value: " + str);
        return uint256S(hex);
    }
    mpz_class value;
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos || value.set_str(str, 10) != 0)
        throw std::invalid_argument("not a decimal integer: " + str);
    return FromMpz(value);
}

static size_t ParseDepth(const std::string& str)
{
    int64_t nDepth;
    if (!ParseInt64(str, &nDepth) || nDepth < 0 || nDepth > SP_MAX_TREE_DEPTH)
        throw std::invalid_argument(tfm::format("depth must be between 0 and %d", SP_MAX_TREE_DEPTH));
    return nDepth;
}

static int CommandPoseidon(const CPoolRuntime& runtime, const std::vector<std::string>& args)
{
    std::vector<uint256> inputs;
    for (const std::string& arg : args)
        inputs.push_back(ParseFieldElement(arg));
    fprintf(stdout, "0x%s\n", runtime.poseidon.Hash(inputs).GetHex().c_str());
    return EXIT_SUCCESS;
}

static int CommandAssetId(const CPoolRuntime& runtime, const std::vector<std::string>& args)
{
    if (args.size() != 1)
        throw std::invalid_argument("assetid takes one mint address");
    std::string hex = args[0];
    if (hex.compare(0, 2, "0x") == 0)
        hex = hex.substr(2);
    if (!IsHex(hex) || hex.size() != 64)
        throw std::invalid_argument("mint must be 32 bytes of hex");
    fprintf(stdout, "0x%s\n", DeriveAssetId(uint256S(hex)).GetHex().c_str());
    return EXIT_SUCCESS;
}

static int CommandZeros(const CPoolRuntime& runtime, const std::vector<std::string>& args)
{
    if (args.size() != 1)
        throw std::invalid_argument("zeros takes a depth");
    size_t depth = ParseDepth(args[0]);
    for (size_t i = 0; i <= depth; i++)
        fprintf(stdout, "%2d 0x%s\n", (int)i, runtime.hasher.empty_root(i).GetHex().c_str());
    return EXIT_SUCCESS;
}

static int CommandRoot(const CPoolRuntime& runtime, const std::vector<std::string>& args)
{
    if (args.empty())
        throw std::invalid_argument("root takes a depth and any number of leaves");
    MerkleTreeState tree(runtime.hasher, ParseDepth(args[0]), SP_MIN_ROOT_HISTORY);
    std::vector<uint256> leaves;
    for (auto it = std::next(args.begin()); it != args.end(); ++it)
        leaves.push_back(ParseFieldElement(*it));
    tree.insertBatch(leaves);
    fprintf(stdout, "0x%s\n", tree.currentRoot().GetHex().c_str());
    return EXIT_SUCCESS;
}

static int CommandVerify(const CPoolRuntime& runtime, const std::vector<std::string>& args)
{
    if (args.size() < 2)
        throw std::invalid_argument("verify takes a key file, a proof and the public inputs");

    fs::ifstream stream(args[0]);
    if (!stream.good())
        throw std::runtime_error("cannot open " + args[0]);
    std::string strJSON((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    UniValue obj;
    if (!obj.read(strJSON))
        throw std::runtime_error(args[0] + " is not valid JSON");
    VerificationKey vk = VerificationKey::FromJSON(obj);
    vk.locked = true;

    std::string strProof = args[1];
    if (strProof.compare(0, 2, "0x") == 0)
        strProof = strProof.substr(2);
    if (!IsHex(strProof))
        throw std::invalid_argument("proof must be hex");
    GrothProof proof = ParseHex(strProof);

    std::vector<uint256> inputs;
    for (size_t i = 2; i < args.size(); i++)
        inputs.push_back(ParseFieldElement(args[i]));

    bool fValid = runtime.verifier.Verify(vk, inputs, proof);
    LogPrint("groth16", "verify: key %s, %d inputs, result %d\n", vk.GetHash().GetHex(), inputs.size(), fValid);
    fprintf(stdout, "%s\n", fValid ? "valid" : "invalid");
    return fValid ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int AppInitUtil(int argc, char* argv[])
{
    ParseParameters(argc, argv);

    if (argc < 2 || mapArgs.count("-?") || mapArgs.count("-h") || mapArgs.count("-help")) {
        std::string strUsage = "Shieldpool utility\n\n"
            "Usage:\n"
            "  shieldpool-util [options] poseidon <x> <y> [<z> <w>]   Poseidon hash of two or four field elements\n"
            "  shieldpool-util [options] assetid <mint-hex>          Asset id of a mint address\n"
            "  shieldpool-util [options] zeros <depth>               Empty-subtree roots up to depth\n"
            "  shieldpool-util [options] root <depth> <leaf>...      Root of a tree holding the leaves\n"
            "  shieldpool-util [options] verify <vk.json> <proof-hex> <input>...\n"
            "                                                        Verify a Groth16 proof\n\n";
        strUsage += HelpMessage();
        fprintf(stdout, "%s", strUsage.c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    try {
        ReadConfigFile(GetArg("-conf", SHIELDPOOL_CONF_FILENAME), mapArgs, mapMultiArgs);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static int CommandLineUtil(int argc, char* argv[])
{
    // Skip switches
    while (argc > 1 && IsSwitchChar(argv[1][0])) {
        argc--;
        argv++;
    }
    if (argc < 2) {
        fprintf(stderr, "Error: missing command\n");
        return EXIT_FAILURE;
    }
    std::string strCommand = argv[1];
    std::vector<std::string> args(&argv[2], &argv[argc]);

    std::unique_ptr<CPoolRuntime> runtime;
    if (!AppInitPool(runtime))
        return EXIT_FAILURE;

    try {
        if (strCommand == "poseidon")
            return CommandPoseidon(*runtime, args);
        if (strCommand == "assetid")
            return CommandAssetId(*runtime, args);
        if (strCommand == "zeros")
            return CommandZeros(*runtime, args);
        if (strCommand == "root")
            return CommandRoot(*runtime, args);
        if (strCommand == "verify")
            return CommandVerify(*runtime, args);
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, strCommand.c_str());
        return EXIT_FAILURE;
    }
    fprintf(stderr, "Error: unknown command %s\n", strCommand.c_str());
    return EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    int ret = AppInitUtil(argc, argv);
    if (ret != CONTINUE_EXECUTION)
        return ret;

    InitParameterInteraction();
    InitLogging();

    ret = CommandLineUtil(argc, argv);
    Shutdown();
    return ret;
}
