#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "consensus/params.h"
#include "init.h"
#include "logging.h"
#include "shieldpool/ShieldPool.h"
#include "util/system.h"

#include <fstream>
#include <sstream>

using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> savedArgs;
    std::map<std::string, std::vector<std::string> > savedMultiArgs;

    void SetUp() {
        savedArgs = mapArgs;
        savedMultiArgs = mapMultiArgs;
    }

    void TearDown() {
        mapArgs = savedArgs;
        mapMultiArgs = savedMultiArgs;
    }

    // ParseParameters replaces every argument, including the ones the
    // test harness set for logging.
    void Parse(std::vector<const char*> argv) {
        argv.insert(argv.begin(), "shieldpool-util");
        ParseParameters(argv.size(), argv.data());
        mapArgs["-debuglogfile"] = savedArgs["-debuglogfile"];
    }
};

TEST(ConsensusParams, Networks) {
    const Consensus::Params& main = Consensus::ParamsFor("main");
    EXPECT_EQ(main.strNetworkID, "main");
    EXPECT_EQ(main.nTreeDepth, 20u);
    EXPECT_EQ(main.nRootHistorySize, 100u);
    EXPECT_EQ(main.nMinWithdrawalAmount, 100u);
    EXPECT_EQ(main.nMaxRelayerFeeDivisor, 10u);

    const Consensus::Params& regtest = Consensus::ParamsFor("regtest");
    EXPECT_EQ(regtest.nTreeDepth, (uint32_t)SP_TREE_DEPTH_TESTING);
    EXPECT_EQ(regtest.nRootHistorySize, (uint32_t)SP_MIN_ROOT_HISTORY);
    EXPECT_EQ(regtest.nMaxBatchSize, main.nMaxBatchSize);
    EXPECT_EQ(&Consensus::RegtestParams(), &regtest);

    EXPECT_THROW(Consensus::ParamsFor("testnet"), std::runtime_error);
}

TEST_F(ConfigTest, ParseParameters) {
    Parse({"-treedepth=8", "--curvebackend=reference", "-nologtimestamps", "-debug=pool", "-debug=merkle", "stray", "-ignored"});
    EXPECT_EQ(GetArg("-treedepth", (int64_t)0), 8);
    EXPECT_EQ(GetArg("-curvebackend", ""), "reference");
    EXPECT_FALSE(GetBoolArg("-logtimestamps", true));
    EXPECT_EQ(mapMultiArgs["-debug"].size(), 2u);
    EXPECT_EQ(mapArgs.count("-ignored"), 0u);

    EXPECT_FALSE(SoftSetArg("-treedepth", "12"));
    EXPECT_TRUE(SoftSetArg("-roothistory", "30"));
    EXPECT_EQ(GetArg("-roothistory", (int64_t)0), 30);
    EXPECT_TRUE(SoftSetBoolArg("-printtoconsole", true));
    EXPECT_TRUE(GetBoolArg("-printtoconsole", false));
}

TEST_F(ConfigTest, RegtestShrinksTheTree) {
    Parse({"-network=regtest"});
    InitParameterInteraction();
    EXPECT_EQ(GetArg("-treedepth", (int64_t)0), SP_TREE_DEPTH_TESTING);
    EXPECT_EQ(GetArg("-roothistory", (int64_t)0), SP_MIN_ROOT_HISTORY);

    Parse({"-network=regtest", "-treedepth=10"});
    InitParameterInteraction();
    EXPECT_EQ(GetArg("-treedepth", (int64_t)0), 10);
}

TEST_F(ConfigTest, AppInitPool) {
    std::unique_ptr<CPoolRuntime> runtime;

    Parse({"-network=regtest", "-curvebackend=reference"});
    ASSERT_TRUE(AppInitPool(runtime));
    EXPECT_EQ(runtime->params.strNetworkID, "regtest");
    EXPECT_EQ(runtime->curve->Name(), "reference");

    Parse({"-treedepth=12", "-roothistory=30"});
    ASSERT_TRUE(AppInitPool(runtime));
    EXPECT_EQ(runtime->params.nTreeDepth, 12u);
    EXPECT_EQ(runtime->params.nRootHistorySize, 30u);
    EXPECT_EQ(runtime->curve->Name(), DEFAULT_CURVE_BACKEND);

    std::unique_ptr<CPoolRuntime> rejected;
    Parse({"-treedepth=25"});
    EXPECT_FALSE(AppInitPool(rejected));
    Parse({"-roothistory=2"});
    EXPECT_FALSE(AppInitPool(rejected));
    Parse({"-curvebackend=bls12"});
    EXPECT_FALSE(AppInitPool(rejected));
    Parse({"-network=testnet"});
    EXPECT_FALSE(AppInitPool(rejected));
    EXPECT_FALSE(rejected);
}

TEST_F(ConfigTest, ReadConfigFile) {
    fs::path confPath = fs::temp_directory_path() / fs::unique_path("%%%%%%%%.conf");
    {
        std::ofstream conf(confPath.string());
        conf << "curvebackend=reference\n";
        conf << "treedepth=6\n";
        conf << "debug=batch\n";
    }

    Parse({"-treedepth=8"});
    ReadConfigFile(confPath.string(), mapArgs, mapMultiArgs);
    fs::remove(confPath);

    // Command-line values take precedence over the file.
    EXPECT_EQ(GetArg("-treedepth", (int64_t)0), 8);
    EXPECT_EQ(GetArg("-curvebackend", ""), "reference");
    ASSERT_EQ(mapMultiArgs["-debug"].size(), 1u);
    EXPECT_EQ(mapMultiArgs["-debug"][0], "batch");

    // A missing default file is fine; a missing -conf file is not.
    std::string strMissing = confPath.string() + ".missing";
    EXPECT_NO_THROW(ReadConfigFile(strMissing, mapArgs, mapMultiArgs));
    mapArgs["-conf"] = strMissing;
    EXPECT_THROW(ReadConfigFile(strMissing, mapArgs, mapMultiArgs), missing_shieldpool_conf);
}

TEST_F(ConfigTest, HelpMessage) {
    std::string strHelp = HelpMessage();
    EXPECT_THAT(strHelp, HasSubstr("-curvebackend=<name>"));
    EXPECT_THAT(strHelp, HasSubstr("libsnark, reference"));
    EXPECT_THAT(strHelp, HasSubstr("-treedepth=<n>"));
    EXPECT_THAT(strHelp, HasSubstr("-roothistory=<n>"));
    EXPECT_THAT(strHelp, HasSubstr("-debuglogfile=<file>"));
}

TEST_F(ConfigTest, LogConfigFilter) {
    mapMultiArgs["-debug"].clear();
    EXPECT_EQ(LogConfigFilter(), "error,main=info");
    mapMultiArgs["-debug"] = {"merkle", "pool"};
    EXPECT_EQ(LogConfigFilter(), "error,main=info,merkle=debug,pool=debug");
    mapMultiArgs["-debug"] = {"1"};
    EXPECT_EQ(LogConfigFilter(), "debug");
}

TEST(Logging, LinesReachTheDebugLog) {
    LogPrintf("pool %s opened at depth %d\n", "test", 4);
    LogPrint("merkle", "appended leaf %d\n", 7);
    EXPECT_FALSE(LogError("groth16", "key %s is unusable", "deposit"));

    std::ifstream logFile(GetDebugLogPath().string());
    ASSERT_TRUE(logFile.is_open());
    std::stringstream contents;
    contents << logFile.rdbuf();
    EXPECT_THAT(contents.str(), HasSubstr(" info main: pool test opened at depth 4\n"));
    EXPECT_THAT(contents.str(), HasSubstr("debug merkle: appended leaf 7\n"));
    EXPECT_THAT(contents.str(), HasSubstr("ERROR groth16: key deposit is unusable\n"));
}
