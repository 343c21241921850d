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
/// Declaration of functions that initialize the host-memory engine

#include "../../GraphicsEngine/interface/RenderDevice.h"
#include "../../GraphicsEngine/interface/DeviceContext.h"

namespace Bindery
{

// {B7E1C4A9-0D52-4F36-8A1B-9C3E5F7D2B60}
static constexpr INTERFACE_ID IID_EngineFactoryHost =
    {0xb7e1c4a9, 0x0d52, 0x4f36, {0x8a, 0x1b, 0x9c, 0x3e, 0x5f, 0x7d, 0x2b, 0x60}};

/// Attributes of the host-memory engine
struct EngineHostCreateInfo
{
    /// Number of deferred contexts to create along with the immediate context
    Uint32 NumDeferredContexts = 0;

    /// Maximum total size of live buffers and textures, in bytes. Zero means no limit.
    Uint64 DeviceMemoryBudget = 0;

    /// Enables validation of command arguments recorded by deferred contexts
    /// and executed by the immediate context.
    bool EnableValidation = true;
};

/// Engine factory for the host-memory implementation
class IEngineFactoryHost : public IObject
{
public:
    /// Creates a render device and device contexts.

    /// \param [in] EngineCI    - Engine creation attributes.
    /// \param [out] ppDevice   - Address of the memory location where the pointer to
    ///                           the created device will be written.
    /// \param [out] ppContexts - Address of the memory location where pointers to
    ///                           the contexts will be written. The immediate context goes at
    ///                           position 0, followed by EngineCI.NumDeferredContexts deferred contexts.
    virtual void CreateDeviceAndContextsHost(const EngineHostCreateInfo& EngineCI,
                                             IRenderDevice**             ppDevice,
                                             IDeviceContext**            ppContexts) = 0;
};

/// Returns the pointer to the engine factory. The factory is a process-wide singleton.
IEngineFactoryHost* GetEngineFactoryHost();

} // namespace Bindery
