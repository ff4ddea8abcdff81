#include "loginet/network/PipelineOptions.h"
#include "loginet/core/TaskExecutor.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace loginet {

namespace {

int64_t readNonNegative(const json& j, const char* key) {
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("'") + key + "' must be an integer");
    }
    int64_t result = value.get<int64_t>();
    if (result < 0) {
        throw std::runtime_error(std::string("'") + key + "' must not be negative");
    }
    return result;
}

}  // namespace

const char* toString(InvalidGeometryPolicy policy) {
    return policy == InvalidGeometryPolicy::DropAndReport ? "drop" : "fail";
}

InvalidGeometryPolicy parseInvalidGeometryPolicy(const std::string& text) {
    if (text == "fail") return InvalidGeometryPolicy::Fail;
    if (text == "drop") return InvalidGeometryPolicy::DropAndReport;
    throw std::invalid_argument("Unknown geometry policy: " + text);
}

size_t PipelineOptions::defaultWorkerThreads() {
    return ThreadPoolExecutor::defaultWorkerCount();
}

PipelineOptions PipelineOptions::fast() {
    PipelineOptions options;
    options.edgeTimeout = std::chrono::milliseconds(2000);
    options.pipelineTimeout = std::chrono::milliseconds(30000);
    options.providerRetries = 0;      // Degrade immediately
    options.retryBackoff = std::chrono::milliseconds(0);
    return options;
}

PipelineOptions PipelineOptions::balanced() {
    return PipelineOptions{};
}

PipelineOptions PipelineOptions::thorough() {
    PipelineOptions options;
    options.edgeTimeout = std::chrono::milliseconds(0);      // Wait for every route
    options.pipelineTimeout = std::chrono::milliseconds(0);
    options.providerRetries = 4;
    options.retryBackoff = std::chrono::milliseconds(1000);
    return options;
}

std::string PipelineOptions::toJson() const {
    json j;
    j["geometryPolicy"] = toString(geometryPolicy);
    j["refineRoutes"] = refineRoutes;
    j["workerThreads"] = workerThreads;
    j["edgeTimeoutMs"] = edgeTimeout.count();
    j["pipelineTimeoutMs"] = pipelineTimeout.count();
    j["maxSnapDistanceMeters"] = maxSnapDistanceMeters;
    j["providerRetries"] = providerRetries;
    j["retryBackoffMs"] = retryBackoff.count();
    j["largeInputWarning"] = largeInputWarning;
    return j.dump(2);
}

PipelineOptions PipelineOptions::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid pipeline options JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Pipeline options must be a JSON object");
    }

    PipelineOptions options = balanced();

    if (j.contains("geometryPolicy")) {
        if (!j["geometryPolicy"].is_string()) {
            throw std::runtime_error("'geometryPolicy' must be a string");
        }
        try {
            options.geometryPolicy = parseInvalidGeometryPolicy(j["geometryPolicy"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }
    if (j.contains("refineRoutes")) {
        if (!j["refineRoutes"].is_boolean()) {
            throw std::runtime_error("'refineRoutes' must be a boolean");
        }
        options.refineRoutes = j["refineRoutes"].get<bool>();
    }
    if (j.contains("workerThreads")) {
        options.workerThreads = static_cast<size_t>(readNonNegative(j, "workerThreads"));
    }
    if (j.contains("edgeTimeoutMs")) {
        options.edgeTimeout = std::chrono::milliseconds(readNonNegative(j, "edgeTimeoutMs"));
    }
    if (j.contains("pipelineTimeoutMs")) {
        options.pipelineTimeout = std::chrono::milliseconds(readNonNegative(j, "pipelineTimeoutMs"));
    }
    if (j.contains("maxSnapDistanceMeters")) {
        if (!j["maxSnapDistanceMeters"].is_number() || j["maxSnapDistanceMeters"].get<double>() < 0.0) {
            throw std::runtime_error("'maxSnapDistanceMeters' must be a non-negative number");
        }
        options.maxSnapDistanceMeters = j["maxSnapDistanceMeters"].get<double>();
    }
    if (j.contains("providerRetries")) {
        options.providerRetries = static_cast<int>(readNonNegative(j, "providerRetries"));
    }
    if (j.contains("retryBackoffMs")) {
        options.retryBackoff = std::chrono::milliseconds(readNonNegative(j, "retryBackoffMs"));
    }
    if (j.contains("largeInputWarning")) {
        options.largeInputWarning = static_cast<size_t>(readNonNegative(j, "largeInputWarning"));
    }
    return options;
}

PipelineOptions PipelineOptions::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open options file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return fromJson(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

}  // namespace loginet
