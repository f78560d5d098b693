#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace placement {

// Malformed input entity. Fatal for that entity only.
class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string entity_id, std::string code, const std::string& message)
        : std::runtime_error(message), m_entity_id(std::move(entity_id)), m_code(std::move(code)) {}

    const std::string& entity_id() const { return m_entity_id; }
    const std::string& code() const { return m_code; }

private:
    std::string m_entity_id;
    std::string m_code;
};

// One scoring factor could not be computed for a pair.
class FactorError : public std::runtime_error {
public:
    FactorError(std::string factor, const std::string& message)
        : std::runtime_error(message), m_factor(std::move(factor)) {}

    const std::string& factor() const { return m_factor; }

private:
    std::string m_factor;
};

// Reserved floors of a slot cannot all be honoured.
class QuotaInfeasibleError : public std::runtime_error {
public:
    QuotaInfeasibleError(std::string slot_id, std::vector<std::string> categories, const std::string& message)
        : std::runtime_error(message), m_slot_id(std::move(slot_id)), m_categories(std::move(categories)) {}

    const std::string& slot_id() const { return m_slot_id; }
    const std::vector<std::string>& categories() const { return m_categories; }

private:
    std::string m_slot_id;
    std::vector<std::string> m_categories;
};

// The ledger already holds records of this round.
class DuplicateRoundError : public std::runtime_error {
public:
    explicit DuplicateRoundError(std::string round_id)
        : std::runtime_error("round already committed: " + round_id), m_round_id(std::move(round_id)) {}

    const std::string& round_id() const { return m_round_id; }

private:
    std::string m_round_id;
};

class SolverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RoundCancelled : public std::runtime_error {
public:
    RoundCancelled() : std::runtime_error("round cancelled") {}
};

}  // namespace placement
