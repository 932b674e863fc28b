#include "CurveStore.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

bool write_file_atomic(const std::string& path, const std::string& content) {
    try {
        fs::path outp(path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());

        // Write to temporary file first
        std::string temp_path = path + ".tmp";
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[CurveStore] Error: Could not open file for writing: " << temp_path << std::endl;
            return false;
        }

        out << content;
        out.flush();

        if (!out.good()) {
            std::cerr << "[CurveStore] Error: Write failed for: " << temp_path << std::endl;
            out.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }

        out.close();

        // Atomic rename
        if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
            std::cerr << "[CurveStore] Error: Could not rename temp file to " << path << std::endl;
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }
        return true;

    } catch (const fs::filesystem_error& e) {
        std::cerr << "[CurveStore] Error preparing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

CurveStore::CurveStore(std::string curve_path) : curve_path_(std::move(curve_path)) {}

bool CurveStore::load_if_current(const std::string& key, PerplexityCurve& out) const {
    std::ifstream key_in(key_path());
    std::ifstream curve_in(curve_path_);
    if (!key_in.is_open() || !curve_in.is_open()) return false;

    try {
        json key_json;
        key_in >> key_json;
        if (key_json.value("key", std::string()) != key) {
            std::cout << "[CurveStore] Stored curve is stale, recomputing" << std::endl;
            return false;
        }

        json rows;
        curve_in >> rows;
        if (!rows.is_array()) return false;

        PerplexityCurve curve;
        for (const auto& row : rows) {
            curve.points.push_back({row.at("k").get<int>(), row.at("perplexity").get<double>()});
        }
        for (int k : key_json.value("failed_k", std::vector<int>())) {
            SweepPoint failed;
            failed.k = k;
            failed.error = "failed in the stored run";
            curve.failures.push_back(failed);
        }
        out = std::move(curve);
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[CurveStore] Warning: unreadable stored curve (" << e.what() << "), recomputing" << std::endl;
        return false;
    }
}

bool CurveStore::save(const PerplexityCurve& curve, const std::string& key) const {
    json rows = json::array();
    for (const auto& point : curve.points) {
        rows.push_back({{"k", point.k}, {"perplexity", point.perplexity}});
    }

    json key_json;
    key_json["key"] = key;
    key_json["failed_k"] = json::array();
    for (const auto& failed : curve.failures) key_json["failed_k"].push_back(failed.k);

    // Curve first, so a crash in between leaves a stale key, never a stale curve with a fresh key
    if (!write_file_atomic(curve_path_, rows.dump(2) + "\n")) return false;
    if (!write_file_atomic(key_path(), key_json.dump(2) + "\n")) return false;

    std::cout << "[CurveStore] Saved " << curve.points.size() << " curve points to " << curve_path_ << std::endl;
    return true;
}

PerplexityCurve CurveStore::compute_or_load(const std::string& key,
                                            const std::function<PerplexityCurve()>& compute,
                                            bool* loaded) const {
    PerplexityCurve curve;
    if (load_if_current(key, curve)) {
        std::cout << "[CurveStore] Reusing stored curve from " << curve_path_ << std::endl;
        if (loaded) *loaded = true;
        return curve;
    }

    if (loaded) *loaded = false;
    curve = compute();
    if (!save(curve, key)) {
        std::cerr << "[CurveStore] Warning: curve computed but not persisted" << std::endl;
    }
    return curve;
}
