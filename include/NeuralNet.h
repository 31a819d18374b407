#pragma once
#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>
#include "NeuralLayer.h"

struct NetworkConfig {
    size_t inputSize = 0;
    std::vector<size_t> hiddenLayers;
    size_t outputSize = 0;
    double learningRate = 0.1;
    NeuralActivation activation = NeuralActivation::SIGMOID;
    uint32_t seed = 1337;
    bool verbose = false;
    size_t logEvery = 100;
    // Passes made by train() when no explicit count is given.
    size_t epochs = 1000;
};

// Configuration plus parameters; weights[l] is row-major [neuron][input] for layer l+1.
struct NetworkSnapshot {
    NetworkConfig config;
    std::vector<std::vector<double>> weights;
    std::vector<std::vector<double>> biases;
};

// Fully connected feed-forward network trained by per-sample gradient descent on MSE.
class NeuralNet {
public:
    using Activation = NeuralActivation;

    static constexpr uint64_t kMaxSnapshotParameters = 50000000ULL;

    /**
     * @throws Circadia::NeuralNetException on a zero-width layer or non-positive learning rate.
     */
    explicit NeuralNet(NetworkConfig config);

    /**
     * @brief Single forward pass.
     * @throws Circadia::NeuralNetException when input width differs from inputSize.
     */
    std::vector<double> predict(const std::vector<double>& input) const;

    /**
     * @brief Runs `epochs` passes over the data with one SGD step per sample.
     * @pre inputs.size() == targets.size(), every row matches the configured widths.
     * @post Returns the mean per-sample loss of each epoch; also appended to the loss history.
     * @throws Circadia::NeuralNetException on shape mismatch or empty input.
     */
    std::vector<double> train(const std::vector<std::vector<double>>& inputs,
                              const std::vector<std::vector<double>>& targets,
                              size_t epochs);
    std::vector<double> train(const std::vector<std::vector<double>>& inputs,
                              const std::vector<std::vector<double>>& targets);

    const std::vector<double>& getTrainLossHistory() const noexcept { return m_trainLossHistory; }
    const NetworkConfig& config() const noexcept { return m_config; }
    std::vector<size_t> topology() const;

    NetworkSnapshot save() const;

    /**
     * @brief Replaces configuration and parameters with the snapshot's.
     * @throws Circadia::NeuralNetException when parameter shapes disagree with the snapshot topology.
     */
    void load(const NetworkSnapshot& snapshot);

    /**
     * @brief Versioned little-endian binary encoding with an FNV-1a checksum trailer.
     * @throws Circadia::IOException when the stream rejects a write.
     */
    static void writeSnapshot(std::ostream& out, const NetworkSnapshot& snapshot);

    /**
     * @throws Circadia::NeuralNetException on bad signature, version, shape, truncation or checksum,
     *         and on a topology above kMaxSnapshotParameters before any parameter storage is allocated.
     */
    static NetworkSnapshot readSnapshot(std::istream& in);

private:
    double trainSample(const std::vector<double>& input, const std::vector<double>& target);
    void feedForward(const std::vector<double>& input);
    void backpropagate(const std::vector<double>& target);

    NetworkConfig m_config;
    std::vector<DenseLayer> m_layers;
    std::vector<double> m_trainLossHistory;
    std::mt19937 m_rng;
};
