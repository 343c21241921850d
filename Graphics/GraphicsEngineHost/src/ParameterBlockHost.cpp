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


#include "ParameterBlockHost.hpp"

namespace Bindery
{

void ParameterBlockHost::SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size)
{
    if (pBuffer == nullptr)
    {
        m_ConstantBuffers.erase(Slot);
        return;
    }

    auto& Range   = m_ConstantBuffers[Slot];
    Range.pBuffer = pBuffer;
    Range.Offset  = Offset;
    Range.Size    = Size;
}

void ParameterBlockHost::SetBuffer(ShaderPropertyID Slot, IBuffer* pBuffer)
{
    if (pBuffer != nullptr)
        m_Buffers[Slot] = pBuffer;
    else
        m_Buffers.erase(Slot);
}

void ParameterBlockHost::SetTexture(ShaderPropertyID Slot, ITexture* pTexture)
{
    if (pTexture != nullptr)
        m_Textures[Slot] = pTexture;
    else
        m_Textures.erase(Slot);
}

void ParameterBlockHost::SetKeyword(const Char* Name, bool Enable)
{
    VERIFY_EXPR(Name != nullptr);
    if (Enable)
        m_EnabledKeywords.emplace(Name);
    else
        m_EnabledKeywords.erase(Name);
}

const ConstantBufferRange* ParameterBlockHost::GetConstantBuffer(ShaderPropertyID Slot) const
{
    auto it = m_ConstantBuffers.find(Slot);
    return it != m_ConstantBuffers.end() ? &it->second : nullptr;
}

const IBuffer* ParameterBlockHost::GetBuffer(ShaderPropertyID Slot) const
{
    auto it = m_Buffers.find(Slot);
    return it != m_Buffers.end() ? it->second.RawPtr() : nullptr;
}

const ITexture* ParameterBlockHost::GetTexture(ShaderPropertyID Slot) const
{
    auto it = m_Textures.find(Slot);
    return it != m_Textures.end() ? it->second.RawPtr() : nullptr;
}

bool ParameterBlockHost::IsKeywordEnabled(const Char* Name) const
{
    if (Name == nullptr)
        return false;
    return m_EnabledKeywords.find(Name) != m_EnabledKeywords.end();
}

void ParameterBlockHost::Clear()
{
    m_ConstantBuffers.clear();
    m_Buffers.clear();
    m_Textures.clear();
    m_EnabledKeywords.clear();
}

} // namespace Bindery
