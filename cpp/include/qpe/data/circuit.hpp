// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace qpe::data {

/**
 * @brief A qubit addressed by register name and index within the register
 */
struct Qubit {
  std::string register_name;
  std::size_t index = 0;

  bool operator==(const Qubit& other) const = default;
};

/**
 * @brief A named, contiguous group of qubits
 */
class QuantumRegister {
 public:
  QuantumRegister(std::string name, std::size_t size)
      : name_(std::move(name)), size_(size) {}

  const std::string& name() const { return name_; }
  std::size_t size() const { return size_; }

  /**
   * @brief Qubit at position @p index of this register
   * @throws std::out_of_range if @p index is not below size()
   */
  Qubit operator[](std::size_t index) const;

  /// @brief All qubits of the register in index order
  std::vector<Qubit> qubits() const;

  bool operator==(const QuantumRegister& other) const = default;

 private:
  std::string name_;
  std::size_t size_;
};

/**
 * @brief Gate set understood by Circuit
 *
 * U1 is the phase gate diag(1, e^{i angle}); CU1 its controlled version.
 */
enum class GateType { H, X, RX, RY, RZ, U1, CX, CU1, CRZ };

/// @brief Lower-case mnemonic of a gate type ("h", "cu1", ...)
std::string gate_type_to_string(GateType type);

/**
 * @brief A single gate application
 *
 * Qubits are global circuit indices; for controlled gates the control comes
 * first. Non-parametric gates carry an angle of zero.
 */
struct Gate {
  GateType type;
  std::vector<std::size_t> qubits;
  double angle = 0.0;
};

/**
 * @class Circuit
 * @brief Ordered gate list over a set of named registers
 *
 * Registers are laid out in insertion order, so the first register occupies
 * the lowest global indices. Dense evaluation treats global qubit i as bit i
 * of the basis index.
 */
class Circuit {
 public:
  Circuit() = default;

  /**
   * @brief Construct a circuit over the given registers, in order
   * @throws std::invalid_argument on duplicate register names
   */
  explicit Circuit(const std::vector<QuantumRegister>& registers);

  /**
   * @brief Append a register after the existing ones
   * @throws std::invalid_argument if a register of the same name exists
   */
  void add_register(const QuantumRegister& reg);

  bool has_register(const std::string& name) const;

  const std::vector<QuantumRegister>& get_registers() const {
    return registers_;
  }

  /// @brief Total number of qubits across all registers
  std::size_t num_qubits() const;

  /**
   * @brief Global index of a register qubit
   * @throws std::invalid_argument if the register is unknown
   * @throws std::out_of_range if the index exceeds the register size
   */
  std::size_t global_index(const Qubit& qubit) const;

  /// @name Gate emitters
  /// @{
  void h(const Qubit& target);
  void x(const Qubit& target);
  void rx(double angle, const Qubit& target);
  void ry(double angle, const Qubit& target);
  void rz(double angle, const Qubit& target);
  void u1(double angle, const Qubit& target);
  void cx(const Qubit& control, const Qubit& target);
  void cu1(double angle, const Qubit& control, const Qubit& target);
  void crz(double angle, const Qubit& control, const Qubit& target);
  /// @}

  const std::vector<Gate>& get_gates() const { return gates_; }
  std::size_t num_gates() const { return gates_.size(); }
  std::size_t count_gates(GateType type) const;

  /**
   * @brief Dense unitary of the whole circuit
   * @throws std::length_error for more than 14 qubits
   */
  Eigen::MatrixXcd to_matrix() const;

  /// @brief Register sizes and gate counts, one per line
  std::string get_summary() const;

  /**
   * @brief JSON description of the registers and the gate list
   *
   * Each gate is an object with its mnemonic, global qubit indices (control
   * first) and angle.
   */
  nlohmann::json to_json() const;

 private:
  std::vector<QuantumRegister> registers_;
  std::vector<Gate> gates_;

  void _append(GateType type, std::vector<std::size_t> qubits, double angle);
};

}  // namespace qpe::data
