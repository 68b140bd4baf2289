#include "model.h"

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace slaterl;

namespace {

RankingInput random_input(int64_t B, int64_t N, int64_t S, int64_t C) {
    RankingInput in;
    in.state_features = torch::randn({B, S});
    in.src_seq_features = torch::randn({B, N, C});
    return in;
}

} // namespace

TEST(PlackettLuceTest, KnownProbability) {
    // weights 1, 2, 3: P([2, 1]) = 3/6 * 2/3 = 1/3
    auto scores = torch::log(torch::tensor({1.0f, 2.0f, 3.0f})).unsqueeze(0);
    auto slates = torch::tensor({2, 1}, torch::kLong).unsqueeze(0);
    auto lp = plackett_luce_log_prob(scores, slates);
    ASSERT_EQ(lp.sizes(), torch::IntArrayRef({1}));
    EXPECT_NEAR(lp[0].item<double>(), std::log(1.0 / 3.0), 1e-6);
}

TEST(PlackettLuceTest, ProbabilitiesSumToOne) {
    torch::manual_seed(0);
    auto scores = torch::randn({1, 4});

    // all ordered slates of length 2 and all full permutations
    double sum2 = 0.0;
    for (int64_t i = 0; i < 4; ++i) {
        for (int64_t j = 0; j < 4; ++j) {
            if (i == j) continue;
            auto s = torch::tensor({i, j}, torch::kLong).unsqueeze(0);
            sum2 += plackett_luce_log_prob(scores, s).exp().item<double>();
        }
    }
    EXPECT_NEAR(sum2, 1.0, 1e-5);

    std::vector<int64_t> perm = {0, 1, 2, 3};
    double sum4 = 0.0;
    do {
        auto s = torch::tensor(perm, torch::kLong).unsqueeze(0);
        sum4 += plackett_luce_log_prob(scores, s).exp().item<double>();
    } while (std::next_permutation(perm.begin(), perm.end()));
    EXPECT_NEAR(sum4, 1.0, 1e-5);
}

TEST(PlackettLuceTest, RejectsInvalidSlates) {
    auto scores = torch::zeros({1, 3});
    EXPECT_THROW(plackett_luce_log_prob(scores, torch::tensor({0, 0}, torch::kLong).unsqueeze(0)),
                 std::invalid_argument);
    EXPECT_THROW(plackett_luce_log_prob(scores, torch::tensor({0, 3}, torch::kLong).unsqueeze(0)),
                 std::invalid_argument);
    EXPECT_THROW(plackett_luce_log_prob(scores, torch::tensor({0, 1, 2, 0}, torch::kLong).unsqueeze(0)),
                 std::invalid_argument);
    EXPECT_THROW(plackett_luce_log_prob(scores, torch::zeros({2, 1}, torch::kLong)), std::invalid_argument);
    EXPECT_THROW(plackett_luce_decode(scores, 4, true), std::invalid_argument);
}

TEST(PlackettLuceTest, GreedyDecodeSortsByScore) {
    auto scores = torch::tensor({0.1f, 2.0f, -1.0f, 0.7f}).unsqueeze(0);
    torch::Tensor slates, lp;
    std::tie(slates, lp) = plackett_luce_decode(scores, 3, /*greedy=*/true);
    ASSERT_EQ(slates.sizes(), torch::IntArrayRef({1, 3}));
    EXPECT_EQ(slates[0][0].item<int64_t>(), 1);
    EXPECT_EQ(slates[0][1].item<int64_t>(), 3);
    EXPECT_EQ(slates[0][2].item<int64_t>(), 0);
    EXPECT_NEAR(lp[0].item<double>(), plackett_luce_log_prob(scores, slates)[0].item<double>(), 1e-6);
}

TEST(PlackettLuceTest, SampledDecodeHasNoRepeats) {
    torch::manual_seed(1);
    auto scores = torch::randn({64, 7});
    torch::Tensor slates, lp;
    std::tie(slates, lp) = plackett_luce_decode(scores, 7, /*greedy=*/false);
    auto sorted = std::get<0>(slates.sort(1));
    EXPECT_TRUE(torch::equal(sorted, torch::arange(7, torch::kLong).unsqueeze(0).expand({64, 7})));
    EXPECT_TRUE(torch::allclose(lp, plackett_luce_log_prob(scores, slates), 1e-5, 1e-5));
}

TEST(PlackettLuceSlateNetTest, LogProbModeIsDifferentiable) {
    torch::manual_seed(2);
    SlateNetConfig cfg;
    cfg.state_dim = 3;
    cfg.candidate_dim = 5;
    cfg.hidden_dim = 16;
    PlackettLuceSlateNet net(cfg);

    auto in = random_input(8, 6, 3, 5);
    in.tgt_out_idx = torch::tensor({0, 2, 4}, torch::kLong).unsqueeze(0).expand({8, 3}).contiguous();

    auto out = net->forward(in, Seq2SlateMode::PerSeqLogProb);
    ASSERT_EQ(out.log_probs.sizes(), torch::IntArrayRef({8}));
    EXPECT_TRUE(out.log_probs.requires_grad());
    EXPECT_TRUE((out.log_probs <= 0).all().item<bool>());

    out.log_probs.sum().backward();
    for (const auto& p : net->parameters()) {
        ASSERT_TRUE(p.grad().defined());
    }
}

TEST(PlackettLuceSlateNetTest, RankModeMatchesLogProbMode) {
    torch::manual_seed(3);
    SlateNetConfig cfg;
    cfg.state_dim = 4;
    cfg.candidate_dim = 4;
    cfg.hidden_dim = 16;
    PlackettLuceSlateNet net(cfg);

    auto in = random_input(16, 5, 4, 4);
    for (bool greedy : {true, false}) {
        DecodeOptions opts;
        opts.greedy = greedy;
        opts.slate_size = 3;
        auto ranked = net->forward(in, Seq2SlateMode::Rank, opts);
        ASSERT_EQ(ranked.ranked_idx.sizes(), torch::IntArrayRef({16, 3}));
        EXPECT_FALSE(ranked.ranked_probs.requires_grad());

        auto scored = in;
        scored.tgt_out_idx = ranked.ranked_idx;
        auto lp = net->forward(scored, Seq2SlateMode::PerSeqLogProb).log_probs;
        EXPECT_TRUE(torch::allclose(lp.exp().detach(), ranked.ranked_probs, 1e-4, 1e-6));
    }
}

TEST(PlackettLuceSlateNetTest, RankDefaultsToAllCandidates) {
    SlateNetConfig cfg;
    cfg.state_dim = 2;
    cfg.candidate_dim = 2;
    PlackettLuceSlateNet net(cfg);
    auto in = random_input(2, 4, 2, 2);
    auto out = net->forward(in, Seq2SlateMode::Rank);
    EXPECT_EQ(out.ranked_idx.sizes(), torch::IntArrayRef({2, 4}));
}

TEST(PlackettLuceSlateNetTest, RejectsBadInputs) {
    SlateNetConfig cfg;
    cfg.state_dim = 2;
    cfg.candidate_dim = 2;
    PlackettLuceSlateNet net(cfg);

    auto wrong_dims = random_input(2, 4, 3, 2);
    EXPECT_THROW(net->forward(wrong_dims, Seq2SlateMode::Rank), std::invalid_argument);

    auto in = random_input(2, 4, 2, 2);
    DecodeOptions opts;
    opts.temperature = 0.0;
    EXPECT_THROW(net->forward(in, Seq2SlateMode::Rank, opts), std::invalid_argument);
}

TEST(BaselineNetTest, OneValuePerEpisode) {
    BaselineNet net(6, 8);
    auto in = random_input(5, 3, 6, 2);
    auto b = net->forward(in);
    EXPECT_EQ(b.sizes(), torch::IntArrayRef({5, 1}));
    EXPECT_TRUE(b.requires_grad());
}
