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
/// Defines Bindery::IShaderProgram interface and related data structures

#include "DeviceObject.h"
#include "Buffer.h"
#include "Texture.h"

namespace Bindery
{

// {2989B45C-143D-4886-B89C-C3271C2DCC5D}
static constexpr INTERFACE_ID IID_ShaderProgram =
    {0x2989b45c, 0x143d, 0x4886, {0xb8, 0x9c, 0xc3, 0x27, 0x1c, 0x2d, 0xcc, 0x5d}};

/// Index returned by IShaderProgram::FindKernel() when no kernel has the requested name
static constexpr Uint32 INVALID_KERNEL_INDEX = ~0u;

/// Shader program description
struct ShaderProgramDesc : DeviceObjectAttribs
{
    /// Array of NumKernels kernel entry point names. Kernel indices follow the array order.
    const Char* const* KernelNames = nullptr;

    /// Number of kernels in the program
    Uint32 NumKernels = 0;

    ShaderProgramDesc() noexcept {}

    ShaderProgramDesc(const Char* _Name, const Char* const* _KernelNames, Uint32 _NumKernels) noexcept :
        DeviceObjectAttribs{_Name},
        KernelNames{_KernelNames},
        NumKernels{_NumKernels}
    {}
};

/// Compute shader program interface

/// A program contains one or more kernels. Buffers and textures are bound per kernel,
/// constant buffers and keywords are shared by all kernels of the program.
class IShaderProgram : public IDeviceObject
{
public:
    /// Returns the program description used to create the object
    virtual const ShaderProgramDesc& GetDesc() const override = 0;

    /// Returns the index of the kernel with the given name, or INVALID_KERNEL_INDEX
    virtual Uint32 FindKernel(const Char* Name) const = 0;

    /// Returns the number of kernels in the program
    virtual Uint32 GetKernelCount() const = 0;

    /// Binds a range of the buffer as a program-wide constant buffer.

    /// \param [in] Slot    - Constant buffer slot.
    /// \param [in] pBuffer - Buffer to bind. Null unbinds the slot.
    /// \param [in] Offset  - Offset of the range, in bytes.
    /// \param [in] Size    - Size of the range, in bytes.
    virtual void SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size) = 0;

    /// Binds a buffer to a slot of the given kernel
    virtual void SetBuffer(Uint32 Kernel, ShaderPropertyID Slot, IBuffer* pBuffer) = 0;

    /// Binds a texture to a slot of the given kernel
    virtual void SetTexture(Uint32 Kernel, ShaderPropertyID Slot, ITexture* pTexture) = 0;

    /// Enables or disables a program-local keyword
    virtual void SetKeyword(const Char* Name, bool Enable) = 0;
};

} // namespace Bindery
