#include "simulator.h"
#include "model.h"
#include "rank.h"

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <cmath>
#include <sstream>

namespace {

slatesim::SimulatorConfig test_config() {
    slatesim::SimulatorConfig cfg;
    cfg.num_candidates = 5;
    cfg.slate_size = 3;
    cfg.state_dim = 3;
    cfg.candidate_dim = 4;
    cfg.behavior_temperature = 1.5;
    cfg.seed = 123;
    return cfg;
}

} // namespace

TEST(LoggedSlateSimulatorTest, LoggedBatchShapes) {
    slatesim::LoggedSlateSimulator sim(test_config());
    auto b = sim.sample_logged_batch(32);

    EXPECT_EQ(b.batch_size(), 32);
    EXPECT_EQ(b.state_features.sizes(), torch::IntArrayRef({32, 3}));
    EXPECT_EQ(b.src_seq_features.sizes(), torch::IntArrayRef({32, 5, 4}));
    EXPECT_EQ(b.tgt_out_idx.sizes(), torch::IntArrayRef({32, 3}));
    EXPECT_EQ(b.slate_reward.sizes(), torch::IntArrayRef({32}));
    EXPECT_EQ(b.tgt_out_probs.sizes(), torch::IntArrayRef({32}));

    EXPECT_TRUE((b.tgt_out_probs > 0).all().item<bool>());
    EXPECT_TRUE((b.tgt_out_probs <= 1).all().item<bool>());
    EXPECT_TRUE((b.tgt_out_idx >= 0).all().item<bool>());
    EXPECT_TRUE((b.tgt_out_idx < 5).all().item<bool>());

    auto sorted = std::get<0>(b.tgt_out_idx.sort(1));
    EXPECT_FALSE((sorted.slice(1, 1) == sorted.slice(1, 0, 2)).any().item<bool>());
}

TEST(LoggedSlateSimulatorTest, BehaviorProbabilityIsPlackettLuceOverTemperedRelevance) {
    auto cfg = test_config();
    slatesim::LoggedSlateSimulator sim(cfg);
    auto b = sim.sample_logged_batch(64);

    auto rel = sim.relevance(b);
    auto expected = slaterl::plackett_luce_log_prob(rel / cfg.behavior_temperature, b.tgt_out_idx).exp();
    EXPECT_TRUE(torch::allclose(b.tgt_out_probs, expected, 1e-4, 1e-6));
}

TEST(LoggedSlateSimulatorTest, RewardIsDiscountedRelevance) {
    slatesim::LoggedSlateSimulator sim(test_config());
    auto b = sim.sample_logged_batch(4);
    auto rel = sim.relevance(b);

    for (int64_t i = 0; i < 4; ++i) {
        double r = 0.0;
        for (int64_t k = 0; k < 3; ++k) {
            const int64_t j = b.tgt_out_idx[i][k].item<int64_t>();
            r += rel[i][j].item<double>() / std::log2((double)k + 2.0);
        }
        EXPECT_NEAR(b.slate_reward[i].item<double>(), r, 1e-5);
    }
}

TEST(LoggedSlateSimulatorTest, IdealRewardBoundsLoggedReward) {
    slatesim::LoggedSlateSimulator sim(test_config());
    auto b = sim.sample_logged_batch(128);
    auto ideal = sim.ideal_reward(b);
    EXPECT_TRUE((ideal + 1e-5 >= b.slate_reward).all().item<bool>());
}

TEST(LoggedSlateSimulatorTest, SameSeedSameData) {
    slatesim::LoggedSlateSimulator a(test_config());
    slatesim::LoggedSlateSimulator b(test_config());
    auto x = a.sample_logged_batch(8);
    auto y = b.sample_logged_batch(8);
    EXPECT_TRUE(torch::equal(x.state_features, y.state_features));
    EXPECT_TRUE(torch::equal(x.tgt_out_idx, y.tgt_out_idx));
    EXPECT_TRUE(torch::equal(x.slate_reward, y.slate_reward));
}

TEST(LoggedSlateSimulatorTest, RewardNoiseChangesRewardOnly) {
    auto cfg = test_config();
    slatesim::LoggedSlateSimulator clean(cfg);
    cfg.reward_noise = 0.5;
    slatesim::LoggedSlateSimulator noisy(cfg);

    auto c = clean.sample_logged_batch(16);
    auto n = noisy.sample_logged_batch(16);
    EXPECT_TRUE(torch::equal(c.tgt_out_idx, n.tgt_out_idx));
    EXPECT_FALSE(torch::equal(c.slate_reward, n.slate_reward));
}

TEST(LoggedSlateSimulatorTest, InvalidConfig) {
    auto cfg = test_config();
    cfg.slate_size = 6;
    EXPECT_THROW(slatesim::LoggedSlateSimulator{cfg}, std::invalid_argument);

    cfg = test_config();
    cfg.behavior_temperature = 0.0;
    EXPECT_THROW(slatesim::LoggedSlateSimulator{cfg}, std::invalid_argument);
}

TEST(LoggedSlateSimulatorTest, OnPolicyBatchUsesPolicyProbabilities) {
    torch::manual_seed(9);
    auto cfg = test_config();
    slatesim::LoggedSlateSimulator sim(cfg);

    slaterl::SlateNetConfig ncfg;
    ncfg.state_dim = cfg.state_dim;
    ncfg.candidate_dim = cfg.candidate_dim;
    ncfg.hidden_dim = 16;
    slaterl::PlackettLuceSlateNet net(ncfg);

    auto b = sim.sample_on_policy_batch(*net, 32);
    ASSERT_EQ(b.tgt_out_idx.sizes(), torch::IntArrayRef({32, 3}));

    auto lp = net->forward(b, slaterl::Seq2SlateMode::PerSeqLogProb).log_probs;
    EXPECT_TRUE(torch::allclose(lp.exp().detach(), b.tgt_out_probs, 1e-4, 1e-6));
    EXPECT_TRUE(torch::allclose(b.slate_reward, sim.slate_reward(b, b.tgt_out_idx)));
}

TEST(RankTest, PrintsOneLinePerContext) {
    torch::manual_seed(4);
    auto cfg = test_config();
    slatesim::LoggedSlateSimulator sim(cfg);

    slaterl::SlateNetConfig ncfg;
    ncfg.state_dim = cfg.state_dim;
    ncfg.candidate_dim = cfg.candidate_dim;
    slaterl::PlackettLuceSlateNet net(ncfg);

    slateeval::RankConfig rcfg;
    rcfg.contexts = 3;
    std::ostringstream os;
    auto rr = slateeval::rank(*net, sim, rcfg, os);

    EXPECT_EQ(rr.contexts, 3);
    EXPECT_LE(rr.mean_reward, rr.mean_ideal_reward + 1e-6);
    EXPECT_NE(os.str().find("context 2:"), std::string::npos);
    EXPECT_TRUE(net->is_training());
}
