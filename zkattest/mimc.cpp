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

#include "mimc.hpp"

#include <string>

namespace zkattest {

const std::vector<Fr>& mimc_constants(){
    static const std::vector<Fr> c = []{
        init_curve();
        std::vector<Fr> v(kMimcRounds);
        v[0] = 0;
        for(size_t i=1;i<kMimcRounds;i++) v[i] = fr_from_hash("zkattest.mimc7." + std::to_string(i));
        return v;
    }();
    return c;
}

Fr mimc7(const Fr& x, const Fr& k){
    const auto& c = mimc_constants();
    Fr t = x;
    for(size_t i=0;i<kMimcRounds;i++){
        Fr b = t + k + c[i];
        Fr b2 = b*b;
        Fr b4 = b2*b2;
        t = b4*b2*b;
    }
    return t + k;
}

Fr mimc_sponge(const std::vector<Fr>& inputs){
    Fr h = 0;
    for(const Fr& x: inputs) h = h + x + mimc7(x, h);
    return h;
}

} // namespace zkattest
