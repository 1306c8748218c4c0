// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qpe/algorithms/time_evolution.hpp>

#include "native/trotter_suzuki_synthesizer.hpp"

namespace qpe::algorithms {

std::unique_ptr<TimeEvolutionSynthesizer> make_trotter_suzuki_synthesizer() {
  return std::make_unique<native::TrotterSuzukiSynthesizer>();
}

}  // namespace qpe::algorithms
