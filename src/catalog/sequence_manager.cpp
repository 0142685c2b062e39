#include "minipg/catalog/sequence_manager.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/storage/json_codec.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace minipg::catalog {

namespace {

using storage::Json;

constexpr const char* kComponent = "sequence";

[[nodiscard]] std::int64_t safe_increment(std::int64_t value)
{
    if (value == std::numeric_limits<std::int64_t>::max()) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "Sequence next value overflow");
    }
    return value + 1;
}

}  // namespace

std::string row_id_sequence_name(const std::string& table)
{
    return table + "_id_seq";
}

SequenceManager::SequenceManager(Config config)
    : config_{std::move(config)}
{
    if (config_.sequences_path.empty()) {
        throw std::invalid_argument{"SequenceManager requires a sequence document path"};
    }
    if (config_.flush_after == 0U) {
        throw std::invalid_argument{"SequenceManager flush threshold must be non-zero"};
    }
    std::error_code ec;
    if (!std::filesystem::exists(config_.sequences_path, ec)) {
        std::filesystem::create_directories(config_.sequences_path.parent_path(), ec);
        storage::write_json_document(config_.sequences_path, Json::object());
    }
}

SequenceManager::~SequenceManager()
{
    std::scoped_lock lock(cache_mutex_);
    for (auto& pending : pending_flushes_) {
        if (pending.valid()) {
            pending.wait();
        }
    }
}

void SequenceManager::register_sequence(const std::string& name, std::int64_t start)
{
    {
        std::scoped_lock lock(document_mutex_);
        auto document = storage::read_json_document(config_.sequences_path);
        if (!document.contains(name)) {
            document[name] = start;
            storage::write_json_document(config_.sequences_path, document);
        }
    }
    std::scoped_lock lock(cache_mutex_);
    states_.erase(name);
}

std::int64_t SequenceManager::next_value(const std::string& name, bool flush)
{
    std::scoped_lock lock(cache_mutex_);
    reap_flushes(false);

    auto& state = ensure_state(name);
    state.value = safe_increment(state.value);
    state.dirty = true;
    ++state.hits;

    if (state.hits >= config_.flush_after || flush) {
        schedule_flush(name, state.value);
        state.hits = 0U;
        state.dirty = false;
    }
    return state.value;
}

void SequenceManager::flush_all()
{
    std::scoped_lock lock(cache_mutex_);
    reap_flushes(true);

    std::vector<std::pair<std::string, std::int64_t>> values;
    values.reserve(states_.size());
    for (const auto& [name, state] : states_) {
        values.emplace_back(name, state.value);
    }
    if (values.empty()) {
        return;
    }

    write_values(values);
    for (auto& [_, state] : states_) {
        state.dirty = false;
        state.hits = 0U;
    }
}

std::optional<std::int64_t> SequenceManager::persisted_value(const std::string& name) const
{
    std::scoped_lock lock(document_mutex_);
    const auto document = storage::read_json_document(config_.sequences_path);
    const auto it = document.find(name);
    if (it == document.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

std::optional<std::int64_t> SequenceManager::cached_value(const std::string& name) const
{
    std::scoped_lock lock(cache_mutex_);
    const auto it = states_.find(name);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

bool SequenceManager::has_pending_updates() const
{
    std::scoped_lock lock(cache_mutex_);
    return std::any_of(states_.begin(), states_.end(), [](const auto& entry) { return entry.second.dirty; });
}

SequenceManager::SequenceState& SequenceManager::ensure_state(const std::string& name)
{
    auto it = states_.find(name);
    if (it != states_.end()) {
        return it->second;
    }

    const auto persisted = persisted_value(name);
    if (!persisted) {
        throw std::system_error{make_error_code(EngineErrc::SequenceNotFound),
                                "Sequence '" + name + "' not found"};
    }

    SequenceState state{};
    state.value = *persisted;
    auto [emplaced, _] = states_.emplace(name, state);
    return emplaced->second;
}

void SequenceManager::schedule_flush(const std::string& name, std::int64_t value)
{
    if (config_.background == nullptr || !config_.background->running()) {
        write_values({{name, value}});
        return;
    }

    pending_flushes_.push_back(config_.background->submit([this, name, value]() -> storage::TaskResult {
        write_values({{name, value}});
        return {};
    }));
}

void SequenceManager::write_values(const std::vector<std::pair<std::string, std::int64_t>>& values)
{
    std::scoped_lock lock(document_mutex_);
    auto document = storage::read_json_document(config_.sequences_path);
    for (const auto& [name, value] : values) {
        // Out-of-order background writes must never move a counter backwards.
        const auto it = document.find(name);
        if (it != document.end() && it->is_number_integer() && it->get<std::int64_t>() >= value) {
            continue;
        }
        document[name] = value;
    }
    storage::write_json_document(config_.sequences_path, document);
}

void SequenceManager::reap_flushes(bool wait)
{
    auto it = pending_flushes_.begin();
    while (it != pending_flushes_.end()) {
        if (!wait && it->wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
            ++it;
            continue;
        }
        const auto result = it->get();
        if (result.status) {
            report(Severity::Error, "background sequence flush failed: " + result.message);
        }
        it = pending_flushes_.erase(it);
    }
}

void SequenceManager::report(Severity severity, std::string message)
{
    if (!config_.diagnostics) {
        return;
    }
    Diagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.component = kComponent;
    diagnostic.message = std::move(message);
    config_.diagnostics(diagnostic);
}

}  // namespace minipg::catalog
