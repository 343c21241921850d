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
/// Declaration of the ComputeResourceManager class and related helpers

#include "../../GraphicsEngine/interface/RenderDevice.h"
#include "../../GraphicsEngine/interface/Buffer.h"
#include "../../GraphicsEngine/interface/Texture.h"
#include "../../../Common/interface/RefCntAutoPtr.hpp"

namespace Bindery
{

/// Builds the description of a compute buffer with Count elements of Stride bytes.

/// The bind flags and buffer mode are derived from the compute buffer type.
BufferDesc BuildComputeBufferDesc(const Char*         Name,
                                  Uint32              Count,
                                  Uint32              Stride,
                                  COMPUTE_BUFFER_TYPE Type = COMPUTE_BUFFER_TYPE_DEFAULT);

/// Builds the description of a cubic volume with Cells texels along each axis.

/// The volume is a single-sampled 3D texture with unordered access, clamped addressing
/// and explicit lifetime. The render format is set to the render texture format backed
/// by Format, if there is one.
TextureDesc BuildVolumeDesc(const Char* Name, Uint32 Cells, TEXTURE_FORMAT Format);

/// Same as above, but the volume format is given by the render texture format.
TextureDesc BuildVolumeDesc(const Char* Name, Uint32 Cells, RENDER_TEXTURE_FORMAT Format);

/// Returns true if the buffer exists, is valid and has Count elements of Stride bytes.
bool IsBufferReusable(const IBuffer* pBuffer, Uint32 Count, Uint32 Stride);

/// Returns true if the volume exists, is valid, has Cells texels along each
/// axis and was created with the given render texture format.
bool IsVolumeReusable(const ITexture* pVolume, Uint32 Cells, RENDER_TEXTURE_FORMAT Format);

/// Returns true if the volume exists, is valid, has Cells texels along each
/// axis and uses the given texture format.
bool IsVolumeReusable(const ITexture* pVolume, Uint32 Cells, TEXTURE_FORMAT Format);


/// Creates, recreates and releases compute buffers and volumes.

/// Every method takes the slot that holds the resource. The slot is only replaced when the
/// requested shape or format differs from that of the resource it holds, or the resource
/// is no longer valid. Resources are reallocated by the render device passed to the constructor.
///
/// \remarks The manager does not hold any resources itself.
class ComputeResourceManager
{
public:
    explicit ComputeResourceManager(IRenderDevice* pDevice);

    // clang-format off
    ComputeResourceManager           (const ComputeResourceManager&)  = delete;
    ComputeResourceManager& operator=(const ComputeResourceManager&)  = delete;
    ComputeResourceManager           (      ComputeResourceManager&&) = delete;
    ComputeResourceManager& operator=(      ComputeResourceManager&&) = delete;
    // clang-format on

    /// Makes sure the slot holds a valid buffer with Count elements of Stride bytes.

    /// \param[in,out] pBuffer - Buffer slot.
    /// \param[in]     Name    - Buffer name.
    /// \param[in]     Count   - Number of elements.
    /// \param[in]     Stride  - Element size in bytes.
    /// \param[in]     Type    - Compute buffer type.
    /// \return        true if a new buffer has been created, and false if the
    ///                existing buffer has been kept.
    ///
    /// \remarks The buffer type and name are not compared: a buffer with a matching
    ///          shape is kept as is.
    ///          If the buffer cannot be created, the slot is left empty and
    ///          std::runtime_error is thrown.
    bool CreateBuffer(RefCntAutoPtr<IBuffer>& pBuffer,
                      const Char*             Name,
                      Uint32                  Count,
                      Uint32                  Stride,
                      COMPUTE_BUFFER_TYPE     Type = COMPUTE_BUFFER_TYPE_DEFAULT) noexcept(false);

    /// Releases the buffer held by the slot. Does nothing if the slot is empty.
    void ReleaseBuffer(RefCntAutoPtr<IBuffer>& pBuffer);

    /// Makes sure the slot holds a valid Cells x Cells x Cells volume of the given render texture format.

    /// \return true if a new volume has been created.
    /// \remarks If the volume cannot be created, the slot is left empty and
    ///          std::runtime_error is thrown.
    bool CreateVolume(RefCntAutoPtr<ITexture>& pVolume,
                      const Char*              Name,
                      Uint32                   Cells,
                      RENDER_TEXTURE_FORMAT    Format) noexcept(false);

    /// Makes sure the slot holds a valid Cells x Cells x Cells volume of the given texture format.
    bool CreateVolume(RefCntAutoPtr<ITexture>& pVolume,
                      const Char*              Name,
                      Uint32                   Cells,
                      TEXTURE_FORMAT           Format) noexcept(false);

    /// Releases the volume held by the slot. Does nothing if the slot is empty.
    void ReleaseVolume(RefCntAutoPtr<ITexture>& pVolume);

    IRenderDevice* GetDevice() const { return m_pDevice; }

private:
    bool RecreateVolume(RefCntAutoPtr<ITexture>& pVolume, const TextureDesc& VolumeDesc, bool IsReusable);

    IRenderDevice* const m_pDevice;
};

} // namespace Bindery
