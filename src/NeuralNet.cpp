#include "NeuralNet.h"

#include "CircadiaExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <utility>

namespace {
constexpr char kSnapshotSignature[] = "CIRCADIA_NN_V1";
constexpr uint32_t kSnapshotFormatVersion = 1;
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr uint64_t kHardMaxLayerWidth = 1000000ULL;
constexpr uint64_t kHardMaxHiddenLayers = 4096ULL;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (size_t i = 0; i < sizeof(T); ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void writeLE(std::ostream& out, T value) {
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw Circadia::IOException("Binary write failed");
}

template <typename T>
void readLE(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw Circadia::NeuralNetException("Binary read failed or snapshot is truncated");
    if (!isLittleEndian()) swapEndian(value);
}

template <typename T>
void writeChecked(std::ostream& out, uint64_t& checksum, T value) {
    writeLE(out, value);
    updateChecksum(checksum, value);
}

template <typename T>
T readChecked(std::istream& in, uint64_t& checksum) {
    T value{};
    readLE(in, value);
    updateChecksum(checksum, value);
    return value;
}

std::vector<size_t> layerWidths(const NetworkConfig& config) {
    std::vector<size_t> widths;
    widths.reserve(config.hiddenLayers.size() + 2);
    widths.push_back(config.inputSize);
    widths.insert(widths.end(), config.hiddenLayers.begin(), config.hiddenLayers.end());
    widths.push_back(config.outputSize);
    return widths;
}

void validateConfig(const NetworkConfig& config) {
    for (size_t width : layerWidths(config)) {
        if (width == 0) throw Circadia::NeuralNetException("every layer needs at least one neuron");
    }
    if (!(config.learningRate > 0.0) || !std::isfinite(config.learningRate)) {
        throw Circadia::NeuralNetException("learning rate must be a positive finite number");
    }
}

double meanSquaredError(const std::vector<double>& prediction, const std::vector<double>& target) {
    double err = 0.0;
    for (size_t j = 0; j < target.size(); ++j) {
        const double d = target[j] - prediction[j];
        err += d * d;
    }
    return err / static_cast<double>(target.size());
}
} // namespace

NeuralNet::NeuralNet(NetworkConfig config) : m_config(std::move(config)), m_rng(m_config.seed) {
    validateConfig(m_config);
    const std::vector<size_t> widths = layerWidths(m_config);
    m_layers.reserve(widths.size());
    m_layers.emplace_back(widths.front(), 0, m_config.activation, m_rng);
    for (size_t i = 1; i < widths.size(); ++i) {
        m_layers.emplace_back(widths[i], widths[i - 1], m_config.activation, m_rng);
    }
}

std::vector<size_t> NeuralNet::topology() const {
    return layerWidths(m_config);
}

std::vector<double> NeuralNet::predict(const std::vector<double>& input) const {
    if (input.size() != m_config.inputSize) {
        throw Circadia::NeuralNetException(
            "Input size " + std::to_string(input.size()) + " does not match network input " +
            std::to_string(m_config.inputSize));
    }
    std::vector<double> activations = input;
    for (size_t l = 1; l < m_layers.size(); ++l) {
        activations = m_layers[l].evaluate(activations);
    }
    return activations;
}

void NeuralNet::feedForward(const std::vector<double>& input) {
    std::copy(input.begin(), input.end(), m_layers.front().outputs().begin());
    for (size_t l = 1; l < m_layers.size(); ++l) {
        m_layers[l].forward(m_layers[l - 1]);
    }
}

void NeuralNet::backpropagate(const std::vector<double>& target) {
    m_layers.back().computeOutputGradients(target);
    for (size_t l = m_layers.size() - 2; l > 0; --l) {
        m_layers[l].accumulateHiddenGradients(m_layers[l + 1]);
        m_layers[l].applyActivationDerivative();
    }
    for (size_t l = 1; l < m_layers.size(); ++l) {
        m_layers[l].updateParameters(m_layers[l - 1], m_config.learningRate);
    }
}

double NeuralNet::trainSample(const std::vector<double>& input, const std::vector<double>& target) {
    feedForward(input);
    const double loss = meanSquaredError(m_layers.back().outputs(), target);
    backpropagate(target);
    return loss;
}

std::vector<double> NeuralNet::train(const std::vector<std::vector<double>>& inputs,
                                     const std::vector<std::vector<double>>& targets) {
    return train(inputs, targets, m_config.epochs);
}

std::vector<double> NeuralNet::train(const std::vector<std::vector<double>>& inputs,
                                     const std::vector<std::vector<double>>& targets,
                                     size_t epochs) {
    if (inputs.empty()) throw Circadia::NeuralNetException("Training requires at least one sample");
    if (inputs.size() != targets.size()) {
        throw Circadia::NeuralNetException(
            "Got " + std::to_string(inputs.size()) + " inputs but " + std::to_string(targets.size()) + " targets");
    }
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].size() != m_config.inputSize || targets[i].size() != m_config.outputSize) {
            throw Circadia::NeuralNetException("Sample " + std::to_string(i) + " does not match the network topology");
        }
    }

    std::vector<double> losses;
    losses.reserve(epochs);
    for (size_t epoch = 0; epoch < epochs; ++epoch) {
        double totalLoss = 0.0;
        for (size_t i = 0; i < inputs.size(); ++i) {
            totalLoss += trainSample(inputs[i], targets[i]);
        }
        const double epochLoss = totalLoss / static_cast<double>(inputs.size());
        losses.push_back(epochLoss);

        if (m_config.verbose && m_config.logEvery > 0 && epoch % m_config.logEvery == 0) {
            std::cout << "[Circadia] Epoch " << epoch << ": Loss = " << epochLoss << "\n";
        }
    }
    m_trainLossHistory.insert(m_trainLossHistory.end(), losses.begin(), losses.end());
    return losses;
}

NetworkSnapshot NeuralNet::save() const {
    NetworkSnapshot snapshot;
    snapshot.config = m_config;
    for (size_t l = 1; l < m_layers.size(); ++l) {
        snapshot.weights.push_back(m_layers[l].weights());
        snapshot.biases.push_back(m_layers[l].biases());
    }
    return snapshot;
}

void NeuralNet::load(const NetworkSnapshot& snapshot) {
    validateConfig(snapshot.config);
    const std::vector<size_t> widths = layerWidths(snapshot.config);
    const size_t parameterLayers = widths.size() - 1;
    if (snapshot.weights.size() != parameterLayers || snapshot.biases.size() != parameterLayers) {
        throw Circadia::NeuralNetException(
            "Snapshot has " + std::to_string(snapshot.weights.size()) + " weight layers for a topology needing " +
            std::to_string(parameterLayers));
    }
    for (size_t l = 0; l < parameterLayers; ++l) {
        if (snapshot.weights[l].size() != widths[l + 1] * widths[l] || snapshot.biases[l].size() != widths[l + 1]) {
            throw Circadia::NeuralNetException("Snapshot layer " + std::to_string(l + 1) + " has the wrong shape");
        }
    }

    NeuralNet rebuilt(snapshot.config);
    for (size_t l = 1; l < rebuilt.m_layers.size(); ++l) {
        rebuilt.m_layers[l].weights() = snapshot.weights[l - 1];
        rebuilt.m_layers[l].biases() = snapshot.biases[l - 1];
    }
    rebuilt.m_trainLossHistory.clear();
    *this = std::move(rebuilt);
}

void NeuralNet::writeSnapshot(std::ostream& out, const NetworkSnapshot& snapshot) {
    if (snapshot.weights.size() != snapshot.biases.size()) {
        throw Circadia::NeuralNetException("Snapshot has mismatched weight and bias layer counts");
    }
    out.write(kSnapshotSignature, sizeof(kSnapshotSignature));
    if (!out) throw Circadia::IOException("Failed to write snapshot signature");

    writeLE(out, kSnapshotFormatVersion);
    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, kSnapshotFormatVersion);

    const NetworkConfig& cfg = snapshot.config;
    writeChecked(out, checksum, static_cast<uint64_t>(cfg.inputSize));
    writeChecked(out, checksum, static_cast<uint64_t>(cfg.hiddenLayers.size()));
    for (size_t width : cfg.hiddenLayers) {
        writeChecked(out, checksum, static_cast<uint64_t>(width));
    }
    writeChecked(out, checksum, static_cast<uint64_t>(cfg.outputSize));
    writeChecked(out, checksum, cfg.learningRate);
    writeChecked(out, checksum, static_cast<int32_t>(cfg.activation));
    writeChecked(out, checksum, cfg.seed);
    writeChecked(out, checksum, static_cast<uint8_t>(cfg.verbose ? 1 : 0));
    writeChecked(out, checksum, static_cast<uint64_t>(cfg.logEvery));
    writeChecked(out, checksum, static_cast<uint64_t>(cfg.epochs));

    writeChecked(out, checksum, static_cast<uint64_t>(snapshot.weights.size()));
    for (size_t l = 0; l < snapshot.weights.size(); ++l) {
        writeChecked(out, checksum, static_cast<uint64_t>(snapshot.biases[l].size()));
        for (double b : snapshot.biases[l]) writeChecked(out, checksum, b);
        writeChecked(out, checksum, static_cast<uint64_t>(snapshot.weights[l].size()));
        for (double w : snapshot.weights[l]) writeChecked(out, checksum, w);
    }

    writeLE(out, checksum);
}

NetworkSnapshot NeuralNet::readSnapshot(std::istream& in) {
    char signature[sizeof(kSnapshotSignature)];
    in.read(signature, sizeof(signature));
    if (!in) throw Circadia::NeuralNetException("Failed to read snapshot signature");
    if (std::memcmp(signature, kSnapshotSignature, sizeof(kSnapshotSignature)) != 0) {
        throw Circadia::NeuralNetException("Unsupported or invalid snapshot signature");
    }

    uint32_t version = 0;
    readLE(in, version);
    if (version != kSnapshotFormatVersion) {
        throw Circadia::NeuralNetException("Unsupported snapshot version " + std::to_string(version));
    }
    uint64_t checksum = kChecksumOffsetBasis;
    updateChecksum(checksum, version);

    const auto readWidth = [&](const char* what) {
        const uint64_t width = readChecked<uint64_t>(in, checksum);
        if (width == 0 || width > kHardMaxLayerWidth) {
            throw Circadia::NeuralNetException(std::string("Invalid ") + what + " width in snapshot");
        }
        return static_cast<size_t>(width);
    };

    NetworkSnapshot snapshot;
    NetworkConfig& cfg = snapshot.config;
    cfg.inputSize = readWidth("input");
    const uint64_t hiddenCount = readChecked<uint64_t>(in, checksum);
    if (hiddenCount > kHardMaxHiddenLayers) throw Circadia::NeuralNetException("Invalid hidden layer count in snapshot");
    cfg.hiddenLayers.clear();
    for (uint64_t i = 0; i < hiddenCount; ++i) cfg.hiddenLayers.push_back(readWidth("hidden layer"));
    cfg.outputSize = readWidth("output");
    cfg.learningRate = readChecked<double>(in, checksum);

    const int32_t act = readChecked<int32_t>(in, checksum);
    if (act < static_cast<int32_t>(NeuralActivation::SIGMOID) || act > static_cast<int32_t>(NeuralActivation::TANH)) {
        throw Circadia::NeuralNetException("Invalid activation id " + std::to_string(act) + " in snapshot");
    }
    cfg.activation = static_cast<NeuralActivation>(act);
    cfg.seed = readChecked<uint32_t>(in, checksum);
    cfg.verbose = readChecked<uint8_t>(in, checksum) != 0;
    cfg.logEvery = static_cast<size_t>(readChecked<uint64_t>(in, checksum));
    cfg.epochs = static_cast<size_t>(readChecked<uint64_t>(in, checksum));

    const std::vector<size_t> widths = layerWidths(cfg);
    // Widths are capped, so each term and the running sum stay far below 2^64.
    uint64_t parameterCount = 0;
    for (size_t l = 1; l < widths.size(); ++l) {
        parameterCount += static_cast<uint64_t>(widths[l]) * (static_cast<uint64_t>(widths[l - 1]) + 1);
        if (parameterCount > kMaxSnapshotParameters) {
            throw Circadia::NeuralNetException("Snapshot topology exceeds " + std::to_string(kMaxSnapshotParameters) +
                                               " parameters");
        }
    }
    const uint64_t layerCount = readChecked<uint64_t>(in, checksum);
    if (layerCount != widths.size() - 1) throw Circadia::NeuralNetException("Snapshot layer count disagrees with topology");

    for (uint64_t l = 0; l < layerCount; ++l) {
        const size_t out = widths[static_cast<size_t>(l) + 1];
        const size_t prev = widths[static_cast<size_t>(l)];
        if (readChecked<uint64_t>(in, checksum) != out) {
            throw Circadia::NeuralNetException("Snapshot bias count disagrees with topology");
        }
        std::vector<double> biases(out);
        for (double& b : biases) b = readChecked<double>(in, checksum);
        if (readChecked<uint64_t>(in, checksum) != static_cast<uint64_t>(out) * prev) {
            throw Circadia::NeuralNetException("Snapshot weight count disagrees with topology");
        }
        std::vector<double> weights(out * prev);
        for (double& w : weights) w = readChecked<double>(in, checksum);
        snapshot.biases.push_back(std::move(biases));
        snapshot.weights.push_back(std::move(weights));
    }

    uint64_t storedChecksum = 0;
    readLE(in, storedChecksum);
    if (storedChecksum != checksum) {
        throw Circadia::NeuralNetException("Snapshot checksum mismatch (corrupt data)");
    }
    return snapshot;
}
