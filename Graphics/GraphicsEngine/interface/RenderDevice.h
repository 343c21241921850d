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
/// Defines Bindery::IRenderDevice interface

#include "../../../Primitives/interface/Object.h"
#include "Buffer.h"
#include "Texture.h"
#include "ShaderProgram.h"
#include "Material.h"
#include "ShaderGlobals.h"

namespace Bindery
{

// {F0E9B607-AE33-4B2B-B1AF-A8B2C3104022}
static constexpr INTERFACE_ID IID_RenderDevice =
    {0xf0e9b607, 0xae33, 0x4b2b, {0xb1, 0xaf, 0xa8, 0xb2, 0xc3, 0x10, 0x40, 0x22}};

/// Render device interface
class IRenderDevice : public IObject
{
public:
    /// Creates a new buffer object

    /// \param [in] BuffDesc   - Buffer description, see Bindery::BufferDesc for details.
    /// \param [in] pBuffData  - Pointer to Bindery::BufferData structure that describes
    ///                          initial buffer data or nullptr if no data is provided.
    /// \param [out] ppBuffer  - Address of the memory location where the pointer to the
    ///                          buffer interface will be stored. The function calls AddRef(),
    ///                          so that the new buffer will contain one reference and must be
    ///                          released by a call to Release().
    ///
    /// \remarks If the buffer cannot be created, the method logs an error and
    ///          writes null to ppBuffer.
    virtual void CreateBuffer(const BufferDesc& BuffDesc,
                              const BufferData* pBuffData,
                              IBuffer**         ppBuffer) = 0;

    /// Creates a new texture object

    /// \param [in] TexDesc     - Texture description, see Bindery::TextureDesc for details.
    /// \param [out] ppTexture  - Address of the memory location where the pointer to the
    ///                           texture interface will be stored.
    ///
    /// \remarks Texture contents are zero-initialized.
    virtual void CreateTexture(const TextureDesc& TexDesc,
                               ITexture**         ppTexture) = 0;

    /// Creates a new compute shader program object
    virtual void CreateShaderProgram(const ShaderProgramDesc& ProgramDesc,
                                     IShaderProgram**         ppProgram) = 0;

    /// Creates a new material object
    virtual void CreateMaterial(const MaterialDesc& MtrlDesc,
                                IMaterial**         ppMaterial) = 0;

    /// Returns the pipeline-wide shader state object.

    /// \remarks The method does not call AddRef() on the returned interface.
    virtual IShaderGlobals* GetShaderGlobals() = 0;
};

} // namespace Bindery
