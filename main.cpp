// main.cpp
#include "trainer.h"
#include "simulator.h"
#include "model.h"
#include "rank.h"
#include "util/logger.h"

#include <torch/torch.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

// ----------------------- Path helpers -----------------------
static fs::path to_abs(fs::path p) {
  if (p.empty() || !p.is_relative()) return p;
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  return ec ? p : abs;
}

enum class RunMode { Train, Rank };

static void usage() {
  std::cerr <<
    "slaterl [--mode train|rank] --ckpt <dir-or-file.pt> [--device cpu|cuda]\n"
    "        [--log <logfile>]\n"
    "        [--resume 0|1] [--warm_start <file.pt>]\n"
    "\n"
    "TRAIN MODE OPTIONS:\n"
    "        [--steps 2000] [--batch 256] [--on_policy 0|1]\n"
    "        [--eval_every 100] [--save_every 500] [--seed 1]\n"
    "\n"
    "SIMULATOR OPTIONS:\n"
    "        [--candidates 10] [--slate 5] [--state_dim 8] [--candidate_dim 8]\n"
    "        [--hidden 64] [--behavior_temp 2.0] [--reward_noise 0.0]\n"
    "\n"
    "RANK MODE OPTIONS:\n"
    "        [--rank_contexts 4] [--rank_sample 0|1] [--rank_temp 1.0]\n";
}

// If ckpt_arg is a file => dir=parent, prefix=stem
// If ckpt_arg is a dir  => dir=ckpt_arg, prefix="ckpt"
static void resolve_ckpt_target(
  const fs::path& ckpt_arg,
  fs::path& out_dir,
  std::string& out_prefix
) {
  const fs::path p = ckpt_arg.empty() ? fs::path("checkpoints") : ckpt_arg;

  if (p.has_extension()) {
    out_dir = p.has_parent_path() ? p.parent_path() : fs::path(".");
    out_prefix = p.stem().string().empty() ? std::string("ckpt") : p.stem().string();
  } else {
    out_dir = p;
    out_prefix = "ckpt";
  }
}

static fs::path make_ckpt_path(const fs::path& dir, const std::string& prefix, std::uint64_t train_step) {
  std::ostringstream name;
  name << prefix << "_step" << train_step << ".pt";
  return dir / name.str();
}

static std::optional<fs::path> find_latest_checkpoint_in_dir(const fs::path& dir) {
  if (!fs::exists(dir) || !fs::is_directory(dir)) return std::nullopt;

  std::optional<fs::path> best;
  std::optional<fs::file_time_type> best_time;

  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const fs::path p = entry.path();
    if (p.extension() != ".pt") continue;

    std::error_code ec;
    const auto t = fs::last_write_time(p, ec);
    if (ec) continue;

    if (!best || t > *best_time || (t == *best_time && p.string() > best->string())) {
      best = p;
      best_time = t;
    }
  }
  return best;
}

static int run(int argc, char** argv) {
  RunMode mode = RunMode::Train;

  std::string ckpt_arg = "checkpoints";     // treated as dir-or-file.pt
  std::string log_arg  = "run.log";
  std::string device_str = "cpu";
  std::string warm_start_arg;
  bool resume = true;

  // ---- Train mode options ----
  std::int64_t steps = 2000;
  std::int64_t batch = 256;
  bool on_policy = false;
  int eval_every = 100;
  int save_every = 500;
  std::uint64_t seed = 1;

  // ---- Simulator / network ----
  slatesim::SimulatorConfig scfg;
  std::int64_t hidden = 64;

  // ---- Rank mode options ----
  slateeval::RankConfig rcfg;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };

    if (a == "--mode") {
      std::string m = need("--mode");
      if (m == "train") mode = RunMode::Train;
      else if (m == "rank") mode = RunMode::Rank;
      else { std::cerr << "Unknown --mode " << m << "\n"; usage(); return 2; }
    } else if (a == "--ckpt") ckpt_arg = need("--ckpt");
    else if (a == "--log") log_arg = need("--log");
    else if (a == "--device") device_str = need("--device");
    else if (a == "--resume") resume = (std::stoi(need("--resume")) != 0);
    else if (a == "--warm_start") warm_start_arg = need("--warm_start");

    // train flags
    else if (a == "--steps") steps = std::stoll(need("--steps"));
    else if (a == "--batch") batch = std::max<std::int64_t>(1, std::stoll(need("--batch")));
    else if (a == "--on_policy") on_policy = (std::stoi(need("--on_policy")) != 0);
    else if (a == "--eval_every") eval_every = std::max(0, std::stoi(need("--eval_every")));
    else if (a == "--save_every") save_every = std::max(0, std::stoi(need("--save_every")));
    else if (a == "--seed") seed = std::stoull(need("--seed"));

    // simulator flags
    else if (a == "--candidates") scfg.num_candidates = std::stoll(need("--candidates"));
    else if (a == "--slate") scfg.slate_size = std::stoll(need("--slate"));
    else if (a == "--state_dim") scfg.state_dim = std::stoll(need("--state_dim"));
    else if (a == "--candidate_dim") scfg.candidate_dim = std::stoll(need("--candidate_dim"));
    else if (a == "--hidden") hidden = std::max<std::int64_t>(1, std::stoll(need("--hidden")));
    else if (a == "--behavior_temp") scfg.behavior_temperature = std::stod(need("--behavior_temp"));
    else if (a == "--reward_noise") scfg.reward_noise = std::stod(need("--reward_noise"));

    // rank flags
    else if (a == "--rank_contexts") rcfg.contexts = std::max(1, std::stoi(need("--rank_contexts")));
    else if (a == "--rank_sample") rcfg.sample = (std::stoi(need("--rank_sample")) != 0);
    else if (a == "--rank_temp") rcfg.temperature = std::stod(need("--rank_temp"));
    else { usage(); return 2; }
  }
  scfg.seed = seed;
  torch::manual_seed(seed);

  fs::path log_path = to_abs(fs::path(log_arg));
  auto logger = std::make_shared<Logger>(log_path, /*max_queue=*/1u<<16);

  fs::path ckpt_dir;
  std::string ckpt_prefix;
  resolve_ckpt_target(fs::path(ckpt_arg), ckpt_dir, ckpt_prefix);
  ckpt_dir = to_abs(ckpt_dir);
  fs::create_directories(ckpt_dir);

  logf(*logger, "Log file: ", log_path.string());
  logf(*logger, "Checkpoint directory: ", ckpt_dir.string(), " (prefix=", ckpt_prefix, ")");

  slatesim::LoggedSlateSimulator sim(scfg);

  // ---- Trainer owns both optimizers + step counter ----
  slaterl::SlateNetConfig ncfg;
  ncfg.state_dim = scfg.state_dim;
  ncfg.candidate_dim = scfg.candidate_dim;
  ncfg.hidden_dim = hidden;
  slaterl::PlackettLuceSlateNet policy(ncfg);
  slaterl::BaselineNet baseline(scfg.state_dim, hidden);

  slaterl::Seq2SlateParameters params;
  params.on_policy = on_policy;
  slaterl::TrainerConfig tcfg;
  tcfg.minibatch_size = batch;
  tcfg.use_gpu = (device_str == "cuda");

  slaterl::Seq2SlateTrainer trainer(policy.ptr(), baseline.ptr(), params, tcfg, logger);
  logf(*logger, "Device: ", (trainer.device().is_cuda() ? "cuda" : "cpu"),
       " on_policy=", (on_policy ? 1 : 0));

  // ---- Resume / warm start ----
  if (resume || mode == RunMode::Rank) {
    fs::path ckpt_input = to_abs(fs::path(ckpt_arg));
    bool loaded = false;

    if (ckpt_input.has_extension() && fs::exists(ckpt_input) && fs::is_regular_file(ckpt_input)) {
      loaded = trainer.load_checkpoint(ckpt_input.string());
      logf(*logger, "Resume: tried file ", ckpt_input.string(), " -> ", (loaded ? "OK" : "FAILED"));
    } else {
      auto latest = find_latest_checkpoint_in_dir(ckpt_dir);
      if (latest) {
        loaded = trainer.load_checkpoint(latest->string());
        logf(*logger, "Resume: latest in dir ", ckpt_dir.string(), " is ", latest->string(),
             " -> ", (loaded ? "OK" : "FAILED"));
      } else {
        logf(*logger, "Resume: no checkpoints found in ", ckpt_dir.string(), " (starting fresh)");
      }
    }
  }
  if (!warm_start_arg.empty()) {
    const auto ws = to_abs(fs::path(warm_start_arg)).string();
    if (!trainer.warm_start(ws)) {
      logf(*logger, "Warm start: ", ws, " not found");
      return 1;
    }
  }

  // =========================
  // RANK MODE
  // =========================
  if (mode == RunMode::Rank) {
    logf(*logger, "Mode: rank");
    logf(*logger, "Rank cfg: contexts=", rcfg.contexts,
         " sample=", (rcfg.sample ? 1 : 0),
         " temp=", rcfg.temperature);
    slateeval::rank(trainer.policy(), sim, rcfg, std::cout);
    return 0;
  }

  // =========================
  // TRAIN MODE
  // =========================
  logf(*logger, "Mode: train (steps=", steps, " batch=", batch, ")");

  for (std::int64_t i = 0; i < steps; ++i) {
    auto logged = on_policy ? sim.sample_on_policy_batch(trainer.policy(), batch)
                            : sim.sample_logged_batch(batch);
    trainer.train_step(logged.to(trainer.device()));

    const auto step = trainer.step_counter();
    if (eval_every > 0 && (step % (std::uint64_t)eval_every) == 0) {
      auto st = slateeval::evaluate(trainer.policy(), sim, /*batches=*/4, batch);
      logf(*logger, "eval step=", step,
           " greedy_reward=", st.mean_reward,
           " ideal_reward=", st.mean_ideal_reward);
    }
    if (save_every > 0 && (step % (std::uint64_t)save_every) == 0) {
      trainer.save_checkpoint(make_ckpt_path(ckpt_dir, ckpt_prefix, step).string());
    }
  }

  // Final checkpoint, unless the loop just wrote this step
  const auto final_step = trainer.step_counter();
  if (save_every == 0 || steps == 0 || (final_step % (std::uint64_t)save_every) != 0) {
    trainer.save_checkpoint(make_ckpt_path(ckpt_dir, ckpt_prefix, final_step).string());
  }
  logf(*logger, "Done. Final train_step=", trainer.step_counter());
  return 0;
}

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    usage();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
