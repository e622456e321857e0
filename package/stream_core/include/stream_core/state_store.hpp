#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "stream_core/config.hpp"
#include "stream_core/engine.hpp"

namespace stream_core {

constexpr int kSchemaVersion = 1;

nlohmann::json model_to_json(const LearnedModel &m);

// Throws InvalidInput on a document that cannot be a LearnedModel.
// Unknown keys are ignored.
LearnedModel model_from_json(const nlohmann::json &j, const EngineConfig &cfg);

// Writes <path>.tmp, then renames it over <path>. Throws PersistenceError.
void save_model(const LearnedModel &m, const std::string &path);

// Missing, unreadable, newer-schema or mismatched files degrade to
// LearnedModel::fresh(cfg) with a warning; never throws for those.
LearnedModel load_model(const std::string &path, const EngineConfig &cfg);

nlohmann::json checkpoint_to_json(const HorizonCheckpoint &cp);
// Reads the "horizon" and "pending" sections. Throws InvalidInput.
HorizonCheckpoint checkpoint_from_json(const nlohmann::json &j);

// Learned model, committed-pick ledger and pending outcomes in one file,
// replaced atomically like save_model.
void save_engine(const DecisionEngine &engine, const std::string &path);

// Restores an engine mid-horizon. A file without a usable ledger starts a
// new horizon on whatever learned model could be read; commitments that
// exceed the configured budget or capacity throw InfeasibleConstraint.
DecisionEngine load_engine(const std::string &path, const EngineConfig &cfg);

} // namespace stream_core
