#pragma once
// CurveStore.hpp
// Persists the perplexity curve and reuses it when inputs and settings are
// unchanged. The curve file holds rows of exactly {k, perplexity}; a sidecar
// "<curve>.key" file holds the cache key and the K values that failed.

#include <functional>
#include <string>
#include <vector>
#include "TopicModelSweep.hpp"

class CurveStore {
public:
    explicit CurveStore(std::string curve_path);

    // Stored curve if the sidecar key equals `key`, otherwise computes,
    // saves and returns a fresh one. `loaded` reports which path was taken.
    PerplexityCurve compute_or_load(const std::string& key,
                                    const std::function<PerplexityCurve()>& compute,
                                    bool* loaded = nullptr) const;

    bool load_if_current(const std::string& key, PerplexityCurve& out) const;
    bool save(const PerplexityCurve& curve, const std::string& key) const;

    const std::string& curve_path() const { return curve_path_; }
    std::string key_path() const { return curve_path_ + ".key"; }

private:
    std::string curve_path_;
};

// Writes `content` to a temp file and renames it over `path`
bool write_file_atomic(const std::string& path, const std::string& content);
