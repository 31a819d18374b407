#pragma once

#include <cstddef>
#include <random>
#include <vector>

enum class NeuralActivation { SIGMOID, RELU, TANH };

const char* toString(NeuralActivation activation);

class DenseLayer {
public:
    DenseLayer() = default;
    DenseLayer(size_t size, size_t prevSize, NeuralActivation activation, std::mt19937& rng);

    size_t size() const noexcept { return m_size; }
    size_t prevSize() const noexcept { return m_prevSize; }

    NeuralActivation activation() const noexcept { return m_activation; }

    std::vector<double>& outputs() noexcept { return m_outputs; }
    const std::vector<double>& outputs() const noexcept { return m_outputs; }

    const std::vector<double>& gradients() const noexcept { return m_gradients; }

    std::vector<double>& biases() noexcept { return m_biases; }
    const std::vector<double>& biases() const noexcept { return m_biases; }

    // Row-major [neuron][input], size() * prevSize() entries.
    std::vector<double>& weights() noexcept { return m_weights; }
    const std::vector<double>& weights() const noexcept { return m_weights; }

    // Training forward pass; caches pre-activations for backprop.
    void forward(const DenseLayer& prev);
    // Stateless forward pass used by prediction.
    std::vector<double> evaluate(const std::vector<double>& input) const;

    void computeOutputGradients(const std::vector<double>& targetValues);
    void accumulateHiddenGradients(const DenseLayer& next);
    void applyActivationDerivative();
    void updateParameters(const DenseLayer& prev, double learningRate);

    static double activate(double x, NeuralActivation activation);
    static double activateDerivativeFromInput(double x, NeuralActivation activation);

private:
    size_t m_size = 0;
    size_t m_prevSize = 0;
    std::vector<double> m_outputs;
    std::vector<double> m_biases;
    std::vector<double> m_weights;
    std::vector<double> m_gradients;
    std::vector<double> m_activationInputs;

    NeuralActivation m_activation = NeuralActivation::SIGMOID;
};
