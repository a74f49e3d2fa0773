// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "circuits.hpp"
#include "error.hpp"
#include "gadgets.hpp"
#include "log.hpp"
#include "mimc.hpp"

#include <cmath>

namespace zkattest {

using LC = LinearCombination;

const char* circuit_name(Circuit c){ return c==Circuit::Model ? "model" : "signal"; }
const char* circuit_id(Circuit c){ return c==Circuit::Model ? "model_attestation" : "signal_attestation"; }

bool parse_circuit(const std::string& s, Circuit& out){
    if(s=="model" || s=="model_attestation"){ out = Circuit::Model; return true; }
    if(s=="signal" || s=="signal_attestation"){ out = Circuit::Signal; return true; }
    return false;
}

size_t public_signal_count(Circuit c){ return c==Circuit::Model ? 3 : 4; }

CircuitBuilder build_model_circuit(const ModelWitness& in){
    init_curve();
    if(in.weights.size() != kModelWeights)
        throw Error(ErrorCode::InvalidInput, "model circuit expects " + std::to_string(kModelWeights) + " weights");

    CircuitBuilder cb(circuit_id(Circuit::Model), kCircuitVersion, 3);
    const size_t model_hash = cb.public_var(0);
    cb.set_value(cb.public_var(1), fr_from_u64(in.version));
    cb.set_value(cb.public_var(2), fr_from_u64(in.timestamp));

    std::vector<LC> w;
    for(int64_t x: in.weights) w.push_back(LC::variable(cb.alloc(fr_from_i64(x))));
    mimc_sponge_gadget(cb, w, model_hash);
    return cb;
}

CircuitBuilder build_signal_circuit(const SignalWitness& in){
    init_curve();
    CircuitBuilder cb(circuit_id(Circuit::Signal), kCircuitVersion, 4);
    const size_t signal_hash = cb.public_var(0);
    const size_t is_valid    = cb.public_var(1);
    const size_t model_hash  = cb.public_var(2);
    const size_t timestamp   = cb.public_var(3);
    cb.set_value(model_hash, in.model_hash);
    cb.set_value(timestamp, fr_from_u64(in.timestamp));

    LC st = LC::variable(cb.alloc(fr_from_u64(in.signal_type)));
    LC cf = LC::variable(cb.alloc(fr_from_u64(in.confidence)));
    to_bits(cb, st, 8);
    to_bits(cb, cf, 8);

    LC type_ge_min = less_than(cb, LC::constant(kSignalTypeMin - 1), st, 8);
    LC type_le_max = less_than(cb, st, LC::constant(kSignalTypeMax + 1), 8);
    LC conf_le_max = less_than(cb, cf, LC::constant(kConfidenceMax + 1), 8);
    size_t type_ok = cb.mul(type_ge_min, type_le_max);
    cb.set_value(is_valid, cb.value(type_ok) * cb.evaluate(conf_le_max));
    cb.enforce(LC::variable(type_ok), conf_le_max, LC::variable(is_valid));

    mimc_sponge_gadget(cb, {st, cf, LC::variable(model_hash), LC::variable(timestamp)}, signal_hash);
    return cb;
}

const R1CS& compiled_circuit(Circuit c){
    static const R1CS model = []{
        ModelWitness in; in.weights.assign(kModelWeights, 0);
        R1CS r = build_model_circuit(in).system();
        dbg("compiled " + r.circuit_id + ": " + std::to_string(r.num_constraints()) + " constraints, "
            + std::to_string(r.num_variables) + " variables");
        return r;
    }();
    static const R1CS signal = []{
        R1CS r = build_signal_circuit(SignalWitness()).system();
        dbg("compiled " + r.circuit_id + ": " + std::to_string(r.num_constraints()) + " constraints, "
            + std::to_string(r.num_variables) + " variables");
        return r;
    }();
    return c==Circuit::Model ? model : signal;
}

int64_t scale_weight(double w){
    double s = std::floor(w * kWeightScale);
    if(!std::isfinite(s) || s < -9.0e18 || s > 9.0e18)
        throw Error(ErrorCode::InvalidInput, "weight out of range");
    return int64_t(s);
}

Fr model_hash_of(const std::vector<int64_t>& scaled_weights){
    init_curve();
    std::vector<Fr> in;
    for(int64_t w: scaled_weights) in.push_back(fr_from_i64(w));
    return mimc_sponge(in);
}

Fr signal_hash_of(uint64_t signal_type, uint64_t confidence, const Fr& model_hash, uint64_t timestamp){
    init_curve();
    return mimc_sponge({fr_from_u64(signal_type), fr_from_u64(confidence), model_hash, fr_from_u64(timestamp)});
}

} // namespace zkattest
