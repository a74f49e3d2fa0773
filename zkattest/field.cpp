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

#include "field.hpp"
#include "error.hpp"

#include <openssl/rand.h>

namespace zkattest {

void init_curve(){
    static const bool inited = []{
        mcl::bn::initPairing(mcl::BN254);
        // G2 has a non-trivial cofactor; reject points outside the r-torsion on load.
        mcl::bn::verifyOrderG2(true);
        return true;
    }();
    (void)inited;
}

const G1& gen_g1(){
    static const G1 P = []{
        init_curve();
        G1 p;
        static const char tag[] = "zkattest-g1";
        mcl::bn::hashAndMapToG1(p, tag, sizeof(tag)-1);
        return p;
    }();
    return P;
}

const G2& gen_g2(){
    static const G2 Q = []{
        init_curve();
        G2 q;
        static const char tag[] = "zkattest-g2";
        mcl::bn::hashAndMapToG2(q, tag, sizeof(tag)-1);
        return q;
    }();
    return Q;
}

G1 g1_zero(){ G1 P; P.clear(); return P; }
G2 g2_zero(){ G2 Q; Q.clear(); return Q; }

G1 hash_to_g1(const std::string& msg){
    init_curve();
    G1 P; mcl::bn::hashAndMapToG1(P, msg.data(), msg.size());
    return P;
}

G2 hash_to_g2(const std::string& msg){
    init_curve();
    G2 Q; mcl::bn::hashAndMapToG2(Q, msg.data(), msg.size());
    return Q;
}

// ---------------------------------------------------------------- scalars
Fr fr_from_u64(uint64_t v){
    Fr x; x.setStr(std::to_string(v), 10);
    return x;
}

Fr fr_from_i64(int64_t v){
    if(v >= 0) return fr_from_u64(uint64_t(v));
    // -(v+1)+1 avoids overflow on INT64_MIN
    Fr x = fr_from_u64(uint64_t(-(v+1)) + 1);
    Fr::neg(x, x);
    return x;
}

bool fr_to_u64(const Fr& x, uint64_t& out){
    std::string h = x.getStr(16);
    if(h.size() > 16) return false;
    out = std::stoull(h, nullptr, 16);
    return true;
}

Fr fr_pow(const Fr& base, uint64_t e){
    Fr r = 1, b = base;
    while(e){
        if(e & 1) r *= b;
        b *= b;
        e >>= 1;
    }
    return r;
}

Fr fr_from_hash(const std::string& msg){
    std::string h = sha256_raw(msg.data(), msg.size());
    Fr x; x.setBigEndianMod(reinterpret_cast<const uint8_t*>(h.data()), h.size());
    return x;
}

Fr fr_random(){
    uint8_t buf[64];
    if(RAND_bytes(buf, sizeof(buf)) != 1) throw Error(ErrorCode::SetupFailure, "RAND_bytes failed");
    static const Fr two256 = fr_pow(Fr(2), 256);
    Fr hi, lo;
    hi.setBigEndianMod(buf, 32);
    lo.setBigEndianMod(buf+32, 32);
    return hi * two256 + lo;
}

Fr fr_random_nonzero(){
    for(;;){
        Fr x = fr_random();
        if(!x.isZero()) return x;
    }
}

std::string fr_to_dec(const Fr& x){ return x.getStr(10); }

Fr fr_from_dec(const std::string& s){
    if(s.empty() || s.size() > 78)
        throw Error(ErrorCode::InvalidInput, "field element: bad length");
    for(char c: s) if(c<'0' || c>'9')
        throw Error(ErrorCode::InvalidInput, "field element: not a decimal integer: " + s);
    Fr x; bool ok = false;
    x.setStr(&ok, s.c_str(), 10);
    if(!ok || x.getStr(10) != s)
        throw Error(ErrorCode::InvalidInput, "field element: not canonical: " + s);
    return x;
}

std::string fr_key(const Fr& x){ return x.getStr(16); }

// --------------------------------------------------------------- encoding
std::string to_hex(const std::string& s){
    static const char* H="0123456789abcdef";
    std::string o; o.reserve(s.size()*2);
    for(unsigned char c: s){ o.push_back(H[c>>4]); o.push_back(H[c&0xf]); }
    return o;
}

bool parse_hex(const std::string& h, std::string& out){
    auto hv=[&](char c)->int{
        if('0'<=c&&c<='9') return c-'0';
        if('a'<=c&&c<='f') return 10+(c-'a');
        if('A'<=c&&c<='F') return 10+(c-'A');
        return -1;
    };
    if(h.size() % 2) return false;
    out.clear(); out.reserve(h.size()/2);
    for(size_t i=0;i<h.size();i+=2){
        int hi=hv(h[i]), lo=hv(h[i+1]);
        if(hi<0||lo<0) return false;
        out.push_back(char((hi<<4)|lo));
    }
    return true;
}

template<class P>
static std::string point_bytes(const P& p){
    uint8_t buf[256];
    size_t n = p.serialize(buf, sizeof(buf));
    if(n == 0) throw Error(ErrorCode::SetupFailure, "mcl serialize failed");
    return std::string(reinterpret_cast<const char*>(buf), n);
}

template<class P>
static P point_from_hex(const std::string& h, const char* what){
    std::string bin;
    if(h.empty() || !parse_hex(h, bin))
        throw Error(ErrorCode::InvalidInput, std::string(what) + ": bad hex");
    P p;
    size_t n = p.deserialize(bin.data(), bin.size());
    if(n == 0 || n != bin.size() || !p.isValid())
        throw Error(ErrorCode::InvalidInput, std::string(what) + ": not a valid point");
    return p;
}

std::string fr_bytes(const Fr& x){ return point_bytes(x); }
std::string g1_bytes(const G1& P){ return point_bytes(P); }
std::string g2_bytes(const G2& Q){ return point_bytes(Q); }

std::string g1_to_hex(const G1& P){ return to_hex(g1_bytes(P)); }
std::string g2_to_hex(const G2& Q){ return to_hex(g2_bytes(Q)); }

G1 g1_from_hex(const std::string& h){ init_curve(); return point_from_hex<G1>(h, "G1"); }
G2 g2_from_hex(const std::string& h){ init_curve(); return point_from_hex<G2>(h, "G2"); }

// ---------------------------------------------------------------- hashing
std::string sha256_raw(const void* data, size_t len){
    Sha256 h;
    h.update(data, len);
    return h.final_raw();
}

std::string sha256_hex(const std::string& s){ return to_hex(sha256_raw(s.data(), s.size())); }

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_);
        throw Error(ErrorCode::SetupFailure, "EVP sha256 init failed");
    }
}

Sha256::~Sha256(){ EVP_MD_CTX_free(ctx_); }

Sha256& Sha256::update(const std::string& s){ return update(s.data(), s.size()); }

Sha256& Sha256::update(const void* data, size_t len){
    if(len && EVP_DigestUpdate(ctx_, data, len) != 1) throw Error(ErrorCode::SetupFailure, "EVP sha256 update failed");
    return *this;
}

Sha256& Sha256::update_u64(uint64_t v){
    uint8_t b[8];
    for(int i=0;i<8;i++) b[i] = uint8_t(v >> (8*i));
    return update(b, sizeof(b));
}

std::string Sha256::final_raw(){
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int hlen = 0;
    if(EVP_DigestFinal_ex(ctx_, h, &hlen) != 1) throw Error(ErrorCode::SetupFailure, "EVP sha256 final failed");
    return std::string(reinterpret_cast<char*>(h), hlen);
}

} // namespace zkattest
