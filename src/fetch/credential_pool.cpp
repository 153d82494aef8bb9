/// @file src/fetch/credential_pool.cpp
/// @brief CredentialPool: exclusive LRU checkout with rate-limit cooldown.

#include "sift/data_loader.hpp"
#include "sift/fetcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sift::fetch {

// ─── Lease ────────────────────────────────────────────────────────────────────

CredentialPool::Lease::Lease(CredentialPool* pool, std::size_t index) noexcept
    : pool_(pool)
    , index_(index) {}

CredentialPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , index_(other.index_) {
    other.pool_ = nullptr;
}

CredentialPool::Lease& CredentialPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_  = other.pool_;
        index_ = other.index_;
        other.pool_ = nullptr;
    }
    return *this;
}

CredentialPool::Lease::~Lease() {
    release();
}

void CredentialPool::Lease::release() noexcept {
    if (pool_ != nullptr) {
        pool_->release(index_);
        pool_ = nullptr;
    }
}

const Credential& CredentialPool::Lease::credential() const noexcept {
    // Entries are never added or removed after construction, so the
    // reference stays valid for the pool's lifetime.
    return pool_->entries_[index_].credential;
}

void CredentialPool::Lease::report_success() noexcept {
    if (pool_ != nullptr) pool_->record(index_, false);
}

void CredentialPool::Lease::report_rate_limited() noexcept {
    if (pool_ != nullptr) pool_->record(index_, true);
}

// ─── CredentialPool ───────────────────────────────────────────────────────────

CredentialPool::CredentialPool(std::vector<Credential> credentials, PoolConfig config)
    : config_(config) {
    if (credentials.empty()) {
        credentials.push_back(Credential{.id = "direct", .token = {}, .proxy = {}});
    }
    entries_.reserve(credentials.size());
    for (auto& c : credentials) {
        entries_.push_back(Entry{.credential = std::move(c)});
    }
}

std::optional<CredentialPool::Lease> CredentialPool::checkout() {
    std::unique_lock lock(mtx_);
    const auto deadline = Clock::now() + config_.checkout_timeout;

    while (true) {
        const auto now = Clock::now();

        std::optional<std::size_t> best;
        auto next_expiry = Clock::time_point::max();
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            const Entry& e = entries_[i];
            if (e.in_use) continue;
            if (e.cooldown_until > now) {
                next_expiry = std::min(next_expiry, e.cooldown_until);
                continue;
            }
            if (!best || e.released_seq < entries_[*best].released_seq) {
                best = i;
            }
        }

        if (best) {
            entries_[*best].in_use = true;
            return Lease(this, *best);
        }

        if (now >= deadline) {
            spdlog::debug("credential checkout timed out after {} ms",
                          config_.checkout_timeout.count());
            return std::nullopt;
        }
        // Wake on a release, on the earliest cooldown expiry, or at the deadline.
        cv_.wait_until(lock, std::min(deadline, next_expiry));
    }
}

void CredentialPool::release(std::size_t index) noexcept {
    {
        std::lock_guard lock(mtx_);
        Entry& e = entries_[index];
        e.in_use = false;
        e.released_seq = ++release_counter_;
    }
    cv_.notify_all();
}

void CredentialPool::record(std::size_t index, bool rate_limited) noexcept {
    std::lock_guard lock(mtx_);
    Entry& e = entries_[index];
    if (!rate_limited) {
        e.strikes = 0;
        return;
    }
    if (++e.strikes >= std::max(1, config_.mark_after_rate_limits)) {
        e.strikes = 0;
        e.cooldown_until = Clock::now() + config_.cooldown;
        spdlog::warn("credential '{}' cooled down for {} ms after repeated rate limiting",
                     e.credential.id, config_.cooldown.count());
    }
}

std::size_t CredentialPool::size() const noexcept {
    return entries_.size();
}

std::size_t CredentialPool::usable() const {
    std::lock_guard lock(mtx_);
    const auto now = Clock::now();
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [now](const Entry& e) { return e.cooldown_until <= now; }));
}

std::size_t CredentialPool::in_use() const {
    std::lock_guard lock(mtx_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [](const Entry& e) { return e.in_use; }));
}

// ─── Credentials file ─────────────────────────────────────────────────────────

std::vector<Credential> CredentialPool::parse(std::string_view content) {
    std::vector<Credential> out;
    std::istringstream stream{std::string(content)};
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        auto fields = core::DataLoader::split_fields(line);
        fields.resize(3);
        if (fields[0].empty()) {
            fields[0] = "cred-" + std::to_string(out.size() + 1);
        }
        out.push_back(Credential{
            .id    = std::move(fields[0]),
            .token = std::move(fields[1]),
            .proxy = std::move(fields[2]),
        });
    }
    return out;
}

std::optional<std::vector<Credential>> CredentialPool::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

}  // namespace sift::fetch
