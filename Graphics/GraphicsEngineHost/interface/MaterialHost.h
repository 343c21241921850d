/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

/// \file
/// Definition of the Bindery::IMaterialHost interface

#include "../../GraphicsEngine/interface/Material.h"
#include "ParameterBlockHost.hpp"

namespace Bindery
{

// {4F7D1E28-9C3B-4A52-B8E6-0D2C5A7F1E94}
static constexpr INTERFACE_ID IID_MaterialHost =
    {0x4f7d1e28, 0x9c3b, 0x4a52, {0xb8, 0xe6, 0x0d, 0x2c, 0x5a, 0x7f, 0x1e, 0x94}};

/// Exposes host-backend-specific functionality of a material object.
class IMaterialHost : public IMaterial
{
public:
    virtual const ParameterBlockHost& GetParameters() const = 0;
};

} // namespace Bindery
