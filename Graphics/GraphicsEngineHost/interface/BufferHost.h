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
/// Definition of the Bindery::IBufferHost interface

#include "../../GraphicsEngine/interface/Buffer.h"

namespace Bindery
{

// {6B1F0B63-0E47-4D8E-9E3C-2A0C3E5D8A11}
static constexpr INTERFACE_ID IID_BufferHost =
    {0x6b1f0b63, 0x0e47, 0x4d8e, {0x9e, 0x3c, 0x2a, 0x0c, 0x3e, 0x5d, 0x8a, 0x11}};

/// Exposes host-backend-specific functionality of a buffer object.
class IBufferHost : public IBuffer
{
public:
    /// Returns a pointer to the buffer storage, or null if the buffer is not valid
    virtual const void* GetData() const = 0;
};

} // namespace Bindery
