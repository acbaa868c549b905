//---------------------------------------------------------------------------//
// Copyright (c) 2022 The assembly_tally Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//---------------------------------------------------------------------------//

#ifndef ASSEMBLY_TALLY_DETAIL_LOG_HPP
#define ASSEMBLY_TALLY_DETAIL_LOG_HPP

#include <iostream>
#include <utility>

// #define ASSEMBLY_TALLY_DISABLE_OUTPUT

namespace assembly {
    namespace tally {
        namespace detail {

            template<typename... Args>
            inline void log(Args &&...args) {
#ifndef ASSEMBLY_TALLY_DISABLE_OUTPUT
                (std::cout << ... << std::forward<Args>(args));
#endif
            }

            template<typename... Args>
            inline void logln(Args &&...args) {
#ifndef ASSEMBLY_TALLY_DISABLE_OUTPUT
                (std::cout << ... << std::forward<Args>(args)) << std::endl;
#endif
            }

        }    // namespace detail
    }        // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_DETAIL_LOG_HPP
