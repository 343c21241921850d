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
/// Definition of the Bindery::IRenderDeviceHost interface

#include "../../GraphicsEngine/interface/RenderDevice.h"

namespace Bindery
{

// {8A9C2F1D-5E63-4B7A-9D04-3C1E7B6F2A58}
static constexpr INTERFACE_ID IID_RenderDeviceHost =
    {0x8a9c2f1d, 0x5e63, 0x4b7a, {0x9d, 0x04, 0x3c, 0x1e, 0x7b, 0x6f, 0x2a, 0x58}};

/// Exposes host-backend-specific functionality of a render device.
class IRenderDeviceHost : public IRenderDevice
{
public:
    /// Returns device memory statistics
    virtual const DeviceMemoryStats& GetMemoryStats() const = 0;

    /// Returns the device memory budget in bytes. Zero means no limit.
    virtual Uint64 GetDeviceMemoryBudget() const = 0;

    /// Simulates device loss: the storage of every live buffer and texture is released
    /// and IsValid() returns false for all of them.
    virtual void InvalidateResources() = 0;

    /// Releases the storage of all live textures created with RESOURCE_LIFETIME_TRACKED.
    /// Textures created with RESOURCE_LIFETIME_EXPLICIT are not affected.
    virtual void ReleaseTrackedResources() = 0;
};

} // namespace Bindery
