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
/// Defines Bindery::IDeviceContext interface and related data structures

#include "../../../Primitives/interface/Object.h"
#include "Buffer.h"
#include "Texture.h"
#include "ShaderProgram.h"
#include "CommandList.h"

namespace Bindery
{

// {DC92711B-A1BE-4319-B2BD-C662D1CC19E4}
static constexpr INTERFACE_ID IID_DeviceContext =
    {0xdc92711b, 0xa1be, 0x4319, {0xb2, 0xbd, 0xc6, 0x62, 0xd1, 0xcc, 0x19, 0xe4}};

/// Device context description
struct DeviceContextDesc
{
    /// Context name
    const Char* Name = nullptr;

    /// Indicates if this is a deferred context
    bool IsDeferred = false;

    /// Context index. The immediate context always has index 0.
    Uint32 ContextId = 0;

    DeviceContextDesc() noexcept {}

    DeviceContextDesc(const Char* _Name, bool _IsDeferred, Uint32 _ContextId) noexcept :
        Name{_Name},
        IsDeferred{_IsDeferred},
        ContextId{_ContextId}
    {}
};

/// Device context interface

/// \remarks An immediate context applies every command when it is called.
///          A deferred context records commands into a command list that is later
///          executed by the immediate context, in the order the commands were recorded.
///          All data passed to a deferred context is copied at record time.
class IDeviceContext : public IObject
{
public:
    /// Returns the context description
    virtual const DeviceContextDesc& GetDesc() const = 0;

    /// Updates the data in the buffer.

    /// \param [in] pBuffer - Buffer to update.
    /// \param [in] Offset  - Offset in bytes from the beginning of the buffer to the update region.
    /// \param [in] Size    - Size in bytes of the data region to update.
    /// \param [in] pData   - Pointer to the data to write to the buffer.
    virtual void UpdateBuffer(IBuffer*    pBuffer,
                              Uint64      Offset,
                              Uint64      Size,
                              const void* pData) = 0;

    /// Binds a range of the buffer as a program-wide constant buffer
    virtual void SetProgramConstantBuffer(IShaderProgram*  pProgram,
                                          ShaderPropertyID Slot,
                                          IBuffer*         pBuffer,
                                          Uint32           Offset,
                                          Uint32           Size) = 0;

    /// Binds a buffer to a slot of the program kernel
    virtual void SetProgramBuffer(IShaderProgram*  pProgram,
                                  Uint32           Kernel,
                                  ShaderPropertyID Slot,
                                  IBuffer*         pBuffer) = 0;

    /// Binds a texture to a slot of the program kernel
    virtual void SetProgramTexture(IShaderProgram*  pProgram,
                                   Uint32           Kernel,
                                   ShaderPropertyID Slot,
                                   ITexture*        pTexture) = 0;

    /// Enables or disables a program-local keyword
    virtual void SetProgramKeyword(IShaderProgram* pProgram, const Char* Name, bool Enable) = 0;

    /// Binds a range of the buffer as a global constant buffer
    virtual void SetGlobalConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) = 0;

    /// Binds a buffer to a global slot
    virtual void SetGlobalBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) = 0;

    /// Binds a texture to a global slot
    virtual void SetGlobalTexture(ShaderPropertyID Slot, ITexture* pTexture) = 0;

    /// Enables or disables a global keyword
    virtual void SetGlobalKeyword(const Char* Name, bool Enable) = 0;

    /// Records all commands captured since the last call to FinishCommandList() into a command list.

    /// \param [out] ppCommandList - Memory location where the pointer to the recorded command list will be written.
    /// \remarks Only deferred contexts can record command lists.
    virtual void FinishCommandList(ICommandList** ppCommandList) = 0;

    /// Executes the recorded command list.

    /// \remarks Only the immediate context can execute command lists.
    virtual void ExecuteCommandList(ICommandList* pCommandList) = 0;
};

} // namespace Bindery
