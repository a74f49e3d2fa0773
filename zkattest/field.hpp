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

// field.hpp
// BN254 scalar-field and group helpers on top of Herumi mcl, SHA-256 via
// OpenSSL EVP, and hex codecs for points and field elements.
//
// Link flags:  -lmcl -lcrypto

#pragma once
#include <mcl/bn.hpp>
#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zkattest {

using Fr = mcl::bn::Fr;
using G1 = mcl::bn::G1;
using G2 = mcl::bn::G2;
using GT = mcl::bn::Fp12;

// Initializes mcl for BN254 exactly once; safe to call from any thread.
void init_curve();

// Deterministic generators (hash-to-curve of a fixed tag).
const G1& gen_g1();
const G2& gen_g2();

// mcl leaves points uninitialized on construction.
G1 g1_zero();
G2 g2_zero();

G1 hash_to_g1(const std::string& msg);
G2 hash_to_g2(const std::string& msg);

// ---------------------------------------------------------------- scalars
Fr fr_from_u64(uint64_t v);
Fr fr_from_i64(int64_t v);                 // negative values map to field negation
bool fr_to_u64(const Fr& x, uint64_t& out); // false when x >= 2^64
Fr fr_pow(const Fr& base, uint64_t e);
Fr fr_from_hash(const std::string& msg);    // SHA-256, reduced mod r
Fr fr_random();                             // OpenSSL CSPRNG, 512 bits reduced mod r
Fr fr_random_nonzero();

std::string fr_to_dec(const Fr& x);
Fr fr_from_dec(const std::string& s);       // throws InvalidInput on non-canonical input
std::string fr_key(const Fr& x);            // canonical lookup key (base 16)

// --------------------------------------------------------------- encoding
std::string to_hex(const std::string& bytes);
bool parse_hex(const std::string& hex, std::string& bytes);

std::string fr_bytes(const Fr& x);
std::string g1_bytes(const G1& P);
std::string g2_bytes(const G2& Q);

std::string g1_to_hex(const G1& P);
std::string g2_to_hex(const G2& Q);
G1 g1_from_hex(const std::string& h);       // throws InvalidInput on bad encoding/off-curve
G2 g2_from_hex(const std::string& h);

// ---------------------------------------------------------------- hashing
std::string sha256_raw(const void* data, size_t len);
std::string sha256_hex(const std::string& s);

// Incremental SHA-256 over an EVP context.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const std::string& s);
    Sha256& update(const void* data, size_t len);
    Sha256& update_u64(uint64_t v);
    Sha256& update_g1(const G1& P){ return update(g1_bytes(P)); }
    Sha256& update_g2(const G2& Q){ return update(g2_bytes(Q)); }
    Sha256& update_fr(const Fr& x){ return update(fr_bytes(x)); }

    std::string final_raw();
    std::string final_hex(){ return to_hex(final_raw()); }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace zkattest
