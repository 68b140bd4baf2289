// model.h
#pragma once

#include "util/core/batch.h"

#include <torch/torch.h>

#include <cstdint>
#include <tuple>

namespace slaterl {

    // ---- Modes ----
    enum class Seq2SlateMode {
        Rank,           // decode a slate
        PerSeqLogProb,  // log-probability of batch.tgt_out_idx
    };

    struct DecodeOptions {
        bool greedy = true;
        double temperature = 1.0;
        int64_t slate_size = 0;     // 0 => tgt_out_idx length if present, else all candidates
    };

    struct Seq2SlateOutput {
        torch::Tensor log_probs;      // [B]     PerSeqLogProb
        torch::Tensor ranked_idx;     // [B, K]  Rank
        torch::Tensor ranked_probs;   // [B]     Rank, probability of ranked_idx
    };

    // ---- Collaborator interfaces ----
    // The trainer only needs forward() and parameters(); any architecture works.
    class SlatePolicy : public torch::nn::Module {
    public:
        virtual Seq2SlateOutput forward(const RankingInput& input,
                                        Seq2SlateMode mode,
                                        const DecodeOptions& opts = {}) = 0;
    };

    class SlateBaseline : public torch::nn::Module {
    public:
        // One value per episode, [B] or [B, 1].
        virtual torch::Tensor forward(const RankingInput& input) = 0;
    };

    // ---- Reference networks ----
    struct SlateNetConfig {
        int64_t state_dim = 8;
        int64_t candidate_dim = 8;
        int64_t hidden_dim = 64;
    };

    // Scores each candidate with an MLP over concat(state, candidate). A slate is
    // drawn position by position without replacement (Plackett-Luce):
    //   log P(y) = sum_t s[y_t] - logsumexp_{j not in y_<t} s[j]
    struct PlackettLuceSlateNetImpl : SlatePolicy {
        torch::nn::Linear fc1{nullptr}, fc2{nullptr}, score{nullptr};

        explicit PlackettLuceSlateNetImpl(const SlateNetConfig& cfg = {});

        Seq2SlateOutput forward(const RankingInput& input,
                                Seq2SlateMode mode,
                                const DecodeOptions& opts = {}) override;

        // [B, N] unnormalized candidate scores
        torch::Tensor scores(const RankingInput& input);

    private:
        SlateNetConfig cfg_;
    };
    TORCH_MODULE(PlackettLuceSlateNet);

    // Predicts the expected slate reward from state features only.
    struct BaselineNetImpl : SlateBaseline {
        torch::nn::Linear fc1{nullptr}, fc2{nullptr}, out{nullptr};

        explicit BaselineNetImpl(int64_t state_dim, int64_t hidden_dim = 64);

        // [B, 1]
        torch::Tensor forward(const RankingInput& input) override;
    };
    TORCH_MODULE(BaselineNet);

    // ---- Plackett-Luce helpers (exposed for tests and the simulator) ----

    // scores [B, N], slates [B, K] -> [B] log-probabilities
    torch::Tensor plackett_luce_log_prob(const torch::Tensor& scores, const torch::Tensor& slates);

    // Decodes K positions. Returns (slates [B, K], log_probs [B]). Not differentiable.
    std::tuple<torch::Tensor, torch::Tensor> plackett_luce_decode(const torch::Tensor& scores,
                                                                  int64_t k,
                                                                  bool greedy);

} // namespace slaterl
