/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_ImageReference_hpp
#define skiff_common_ImageReference_hpp

#include <string>
#include <ostream>


namespace skiff {
namespace common {

struct ImageReference {
    std::string name;
    std::string tag;

    std::string string() const;
    std::string getFamiliarName() const;
    bool matchesRepoTag(const std::string& repoTag) const;

    static ImageReference parse(const std::string& input);

    static const std::string DEFAULT_TAG;
};

bool operator==(const ImageReference&, const ImageReference&);
bool operator!=(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

}
}

#endif
