// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <array>
#include <cmath>
#include <complex>
#include <map>
#include <qpe/data/circuit.hpp>
#include <qpe/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

namespace qpe::data {

namespace {

constexpr std::size_t max_dense_qubits = 14;

using Matrix2cd = std::array<std::array<std::complex<double>, 2>, 2>;

/// Single-qubit matrix of a gate; for controlled gates, the target action
Matrix2cd target_matrix(const Gate& gate) {
  using namespace std::complex_literals;
  const double half = gate.angle / 2.0;
  switch (gate.type) {
    case GateType::H: {
      const double s = 1.0 / std::sqrt(2.0);
      return {{{s, s}, {s, -s}}};
    }
    case GateType::X:
    case GateType::CX:
      return {{{0.0, 1.0}, {1.0, 0.0}}};
    case GateType::RX:
      return {{{std::cos(half), -1i * std::sin(half)},
               {-1i * std::sin(half), std::cos(half)}}};
    case GateType::RY:
      return {{{std::cos(half), -std::sin(half)},
               {std::sin(half), std::cos(half)}}};
    case GateType::RZ:
    case GateType::CRZ:
      return {{{std::exp(-1i * half), 0.0}, {0.0, std::exp(1i * half)}}};
    case GateType::U1:
    case GateType::CU1:
      return {{{1.0, 0.0}, {0.0, std::exp(1i * gate.angle)}}};
  }
  throw std::logic_error("Unhandled gate type");
}

bool is_controlled(GateType type) {
  return type == GateType::CX || type == GateType::CU1 ||
         type == GateType::CRZ;
}

const std::map<GateType, std::string>& gate_names() {
  static const std::map<GateType, std::string> names = {
      {GateType::H, "h"},   {GateType::X, "x"},     {GateType::RX, "rx"},
      {GateType::RY, "ry"}, {GateType::RZ, "rz"},   {GateType::U1, "u1"},
      {GateType::CX, "cx"}, {GateType::CU1, "cu1"}, {GateType::CRZ, "crz"}};
  return names;
}

}  // namespace

// === QuantumRegister ===

Qubit QuantumRegister::operator[](std::size_t index) const {
  if (index >= size_) {
    throw std::out_of_range("Index " + std::to_string(index) +
                            " out of range for register '" + name_ +
                            "' of size " + std::to_string(size_));
  }
  return Qubit{name_, index};
}

std::vector<Qubit> QuantumRegister::qubits() const {
  std::vector<Qubit> result;
  result.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    result.push_back(Qubit{name_, i});
  }
  return result;
}

// === GateType ===

std::string gate_type_to_string(GateType type) {
  return gate_names().at(type);
}

// === Circuit ===

Circuit::Circuit(const std::vector<QuantumRegister>& registers) {
  for (const auto& reg : registers) {
    add_register(reg);
  }
}

void Circuit::add_register(const QuantumRegister& reg) {
  QPE_LOG_TRACE_ENTERING();
  if (has_register(reg.name())) {
    throw std::invalid_argument("Circuit already contains a register named '" +
                                reg.name() + "'");
  }
  registers_.push_back(reg);
}

bool Circuit::has_register(const std::string& name) const {
  for (const auto& reg : registers_) {
    if (reg.name() == name) return true;
  }
  return false;
}

std::size_t Circuit::num_qubits() const {
  std::size_t total = 0;
  for (const auto& reg : registers_) {
    total += reg.size();
  }
  return total;
}

std::size_t Circuit::global_index(const Qubit& qubit) const {
  std::size_t offset = 0;
  for (const auto& reg : registers_) {
    if (reg.name() == qubit.register_name) {
      if (qubit.index >= reg.size()) {
        throw std::out_of_range("Index " + std::to_string(qubit.index) +
                                " out of range for register '" + reg.name() +
                                "' of size " + std::to_string(reg.size()));
      }
      return offset + qubit.index;
    }
    offset += reg.size();
  }
  throw std::invalid_argument("Circuit has no register named '" +
                              qubit.register_name + "'");
}

void Circuit::_append(GateType type, std::vector<std::size_t> qubits,
                      double angle) {
  if (qubits.size() == 2 && qubits[0] == qubits[1]) {
    throw std::invalid_argument("Control and target of " +
                                gate_type_to_string(type) +
                                " must be distinct qubits");
  }
  gates_.push_back(Gate{type, std::move(qubits), angle});
}

void Circuit::h(const Qubit& target) {
  _append(GateType::H, {global_index(target)}, 0.0);
}

void Circuit::x(const Qubit& target) {
  _append(GateType::X, {global_index(target)}, 0.0);
}

void Circuit::rx(double angle, const Qubit& target) {
  _append(GateType::RX, {global_index(target)}, angle);
}

void Circuit::ry(double angle, const Qubit& target) {
  _append(GateType::RY, {global_index(target)}, angle);
}

void Circuit::rz(double angle, const Qubit& target) {
  _append(GateType::RZ, {global_index(target)}, angle);
}

void Circuit::u1(double angle, const Qubit& target) {
  _append(GateType::U1, {global_index(target)}, angle);
}

void Circuit::cx(const Qubit& control, const Qubit& target) {
  _append(GateType::CX, {global_index(control), global_index(target)}, 0.0);
}

void Circuit::cu1(double angle, const Qubit& control, const Qubit& target) {
  _append(GateType::CU1, {global_index(control), global_index(target)},
          angle);
}

void Circuit::crz(double angle, const Qubit& control, const Qubit& target) {
  _append(GateType::CRZ, {global_index(control), global_index(target)},
          angle);
}

std::size_t Circuit::count_gates(GateType type) const {
  std::size_t count = 0;
  for (const auto& gate : gates_) {
    if (gate.type == type) ++count;
  }
  return count;
}

Eigen::MatrixXcd Circuit::to_matrix() const {
  QPE_LOG_TRACE_ENTERING();
  const std::size_t n = num_qubits();
  if (n > max_dense_qubits) {
    throw std::length_error("Dense circuit evaluation is limited to " +
                            std::to_string(max_dense_qubits) +
                            " qubits, circuit has " + std::to_string(n));
  }
  const Eigen::Index dim = Eigen::Index{1} << n;
  Eigen::MatrixXcd unitary = Eigen::MatrixXcd::Identity(dim, dim);

  // Each gate acts on the rows of the accumulated unitary
  for (const auto& gate : gates_) {
    const auto g = target_matrix(gate);
    const bool controlled = is_controlled(gate.type);
    const Eigen::Index control_bit =
        controlled ? (Eigen::Index{1} << gate.qubits[0]) : 0;
    const Eigen::Index target_bit = Eigen::Index{1}
                                    << gate.qubits[controlled ? 1 : 0];

    for (Eigen::Index i = 0; i < dim; ++i) {
      if ((i & target_bit) || (controlled && !(i & control_bit))) {
        continue;
      }
      const Eigen::Index j = i | target_bit;
      const Eigen::RowVectorXcd row0 = unitary.row(i);
      const Eigen::RowVectorXcd row1 = unitary.row(j);
      unitary.row(i) = g[0][0] * row0 + g[0][1] * row1;
      unitary.row(j) = g[1][0] * row0 + g[1][1] * row1;
    }
  }
  return unitary;
}

std::string Circuit::get_summary() const {
  QPE_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "Circuit(" << num_qubits() << " qubits, " << gates_.size()
      << " gates)";
  for (const auto& reg : registers_) {
    oss << "\n  register '" << reg.name() << "': " << reg.size() << " qubits";
  }
  for (const auto& [type, name] : gate_names()) {
    const auto count = count_gates(type);
    if (count > 0) {
      oss << "\n  " << name << ": " << count;
    }
  }
  return oss.str();
}

nlohmann::json Circuit::to_json() const {
  QPE_LOG_TRACE_ENTERING();
  nlohmann::json j;

  nlohmann::json registers = nlohmann::json::array();
  for (const auto& reg : registers_) {
    registers.push_back(
        nlohmann::json{{"name", reg.name()}, {"size", reg.size()}});
  }
  j["registers"] = registers;

  nlohmann::json gates = nlohmann::json::array();
  for (const auto& gate : gates_) {
    gates.push_back(nlohmann::json{{"gate", gate_type_to_string(gate.type)},
                                   {"qubits", gate.qubits},
                                   {"angle", gate.angle}});
  }
  j["gates"] = gates;
  return j;
}

}  // namespace qpe::data
