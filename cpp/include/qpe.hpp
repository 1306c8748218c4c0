// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/algorithms/phase_estimation.hpp>
#include <qpe/algorithms/time_evolution.hpp>
#include <qpe/data/circuit.hpp>
#include <qpe/data/circuit_build_result.hpp>
#include <qpe/data/qubit_operator.hpp>
#include <qpe/data/settings.hpp>
#include <qpe/errors.hpp>
