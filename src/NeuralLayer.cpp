#include "NeuralLayer.h"

#include <algorithm>
#include <cmath>

const char* toString(NeuralActivation activation) {
    switch (activation) {
        case NeuralActivation::SIGMOID: return "sigmoid";
        case NeuralActivation::RELU: return "relu";
        case NeuralActivation::TANH: return "tanh";
    }
    return "sigmoid";
}

DenseLayer::DenseLayer(size_t size, size_t prevSize, NeuralActivation activation, std::mt19937& rng)
    : m_size(size), m_prevSize(prevSize), m_activation(activation) {
    m_outputs.assign(m_size, 0.0);
    m_biases.assign(m_size, 0.0);
    m_gradients.assign(m_size, 0.0);
    m_activationInputs.assign(m_size, 0.0);

    if (m_prevSize == 0) return;

    const size_t weightCount = m_size * m_prevSize;
    double stddev = 0.1;
    if (m_activation == NeuralActivation::RELU) {
        stddev = std::sqrt(2.0 / static_cast<double>(m_prevSize));
    } else {
        stddev = std::sqrt(1.0 / static_cast<double>(m_prevSize));
    }

    std::normal_distribution<> weightDis(0.0, stddev);
    m_weights.resize(weightCount, 0.0);
    for (double& w : m_weights) {
        w = weightDis(rng);
    }
    std::fill(m_biases.begin(), m_biases.end(), 0.01);
}

double DenseLayer::activate(double x, NeuralActivation activation) {
    switch (activation) {
        case NeuralActivation::RELU: return std::max(0.0, x);
        case NeuralActivation::TANH: return std::tanh(x);
        case NeuralActivation::SIGMOID: {
            double clipped = std::clamp(x, -60.0, 60.0);
            return 1.0 / (1.0 + std::exp(-clipped));
        }
    }
    return x;
}

double DenseLayer::activateDerivativeFromInput(double x, NeuralActivation activation) {
    switch (activation) {
        case NeuralActivation::RELU: return x > 0.0 ? 1.0 : 0.0;
        case NeuralActivation::TANH: {
            const double out = std::tanh(x);
            return 1.0 - out * out;
        }
        case NeuralActivation::SIGMOID: {
            const double clipped = std::clamp(x, -60.0, 60.0);
            const double out = 1.0 / (1.0 + std::exp(-clipped));
            return out * (1.0 - out);
        }
    }
    return 1.0;
}

void DenseLayer::forward(const DenseLayer& prev) {
    if (m_prevSize == 0) return;

    for (size_t n = 0; n < m_size; ++n) {
        double sum = m_biases[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            sum += prev.outputs()[pn] * m_weights[weightOffset + pn];
        }
        m_activationInputs[n] = sum;
        m_outputs[n] = activate(sum, m_activation);
    }
}

std::vector<double> DenseLayer::evaluate(const std::vector<double>& input) const {
    std::vector<double> out(m_size, 0.0);
    for (size_t n = 0; n < m_size; ++n) {
        double sum = m_biases[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            sum += input[pn] * m_weights[weightOffset + pn];
        }
        out[n] = activate(sum, m_activation);
    }
    return out;
}

void DenseLayer::computeOutputGradients(const std::vector<double>& targetValues) {
    for (size_t n = 0; n < m_size; ++n) {
        const double delta = m_outputs[n] - targetValues[n];
        m_gradients[n] = delta * activateDerivativeFromInput(m_activationInputs[n], m_activation);
    }
}

void DenseLayer::accumulateHiddenGradients(const DenseLayer& next) {
    std::fill(m_gradients.begin(), m_gradients.end(), 0.0);

    for (size_t nn = 0; nn < next.size(); ++nn) {
        const double nextGrad = next.gradients()[nn];
        const size_t weightOffset = nn * m_size;
        for (size_t n = 0; n < m_size; ++n) {
            m_gradients[n] += next.weights()[weightOffset + n] * nextGrad;
        }
    }
}

void DenseLayer::applyActivationDerivative() {
    for (size_t n = 0; n < m_size; ++n) {
        m_gradients[n] *= activateDerivativeFromInput(m_activationInputs[n], m_activation);
    }
}

void DenseLayer::updateParameters(const DenseLayer& prev, double learningRate) {
    if (m_prevSize == 0) return;

    for (size_t n = 0; n < m_size; ++n) {
        m_biases[n] -= learningRate * m_gradients[n];

        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            m_weights[weightOffset + pn] -= learningRate * m_gradients[n] * prev.outputs()[pn];
        }
    }
}
