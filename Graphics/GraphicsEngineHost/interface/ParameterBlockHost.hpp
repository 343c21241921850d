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
/// Definition of the Bindery::ParameterBlockHost class

#include <unordered_map>
#include <unordered_set>

#include "../../../Common/interface/RefCntAutoPtr.hpp"
#include "../../GraphicsEngine/interface/Buffer.h"
#include "../../GraphicsEngine/interface/Texture.h"

namespace Bindery
{

/// Range of a buffer bound as a constant buffer
struct ConstantBufferRange
{
    RefCntAutoPtr<IBuffer> pBuffer;

    Uint32 Offset = 0;
    Uint32 Size   = 0;
};

/// Host-side storage of shader parameter bindings

/// The block keeps strong references to the bound resources. Binding a null
/// resource clears the slot. A later binding to the same slot replaces the earlier one.
class ParameterBlockHost
{
public:
    void SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size);
    void SetBuffer(ShaderPropertyID Slot, IBuffer* pBuffer);
    void SetTexture(ShaderPropertyID Slot, ITexture* pTexture);
    void SetKeyword(const Char* Name, bool Enable);

    /// Returns the constant buffer range bound to the slot, or null
    const ConstantBufferRange* GetConstantBuffer(ShaderPropertyID Slot) const;

    /// Returns the buffer bound to the slot, or null
    const IBuffer* GetBuffer(ShaderPropertyID Slot) const;

    /// Returns the texture bound to the slot, or null
    const ITexture* GetTexture(ShaderPropertyID Slot) const;

    bool IsKeywordEnabled(const Char* Name) const;

    size_t GetNumEnabledKeywords() const { return m_EnabledKeywords.size(); }

    /// Releases all bound resources and disables all keywords
    void Clear();

private:
    std::unordered_map<ShaderPropertyID, ConstantBufferRange>     m_ConstantBuffers;
    std::unordered_map<ShaderPropertyID, RefCntAutoPtr<IBuffer>>  m_Buffers;
    std::unordered_map<ShaderPropertyID, RefCntAutoPtr<ITexture>> m_Textures;
    std::unordered_set<String>                                    m_EnabledKeywords;
};

} // namespace Bindery
