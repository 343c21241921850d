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


#include "RefCntAutoPtr.hpp"
#include "ObjectBase.hpp"

#include "gtest/gtest.h"

using namespace Bindery;

namespace
{

// {C3A4B8D2-7E1F-4A60-9B35-2D8E6F0A1C47}
static constexpr INTERFACE_ID IID_TestObject =
    {0xc3a4b8d2, 0x7e1f, 0x4a60, {0x9b, 0x35, 0x2d, 0x8e, 0x6f, 0x0a, 0x1c, 0x47}};

class TestObject final : public ObjectBase<IObject>
{
public:
    explicit TestObject(int& NumDestroyed) :
        m_NumDestroyed{NumDestroyed}
    {}

    ~TestObject() override
    {
        ++m_NumDestroyed;
    }

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_TestObject, ObjectBase<IObject>)

private:
    int& m_NumDestroyed;
};

TEST(RefCntAutoPtrTest, Lifetime)
{
    int NumDestroyed = 0;
    {
        RefCntAutoPtr<TestObject> pObj{new TestObject{NumDestroyed}};
        EXPECT_EQ(pObj->GetNumStrongRefs(), 1);

        auto pCopy = pObj;
        EXPECT_EQ(pObj->GetNumStrongRefs(), 2);
        EXPECT_EQ(pCopy, pObj);

        RefCntAutoPtr<TestObject> pMoved{std::move(pCopy)};
        EXPECT_EQ(pCopy, nullptr);
        EXPECT_EQ(pObj->GetNumStrongRefs(), 2);

        pMoved.Release();
        EXPECT_EQ(pMoved, nullptr);
        EXPECT_EQ(pObj->GetNumStrongRefs(), 1);
        EXPECT_EQ(NumDestroyed, 0);
    }
    EXPECT_EQ(NumDestroyed, 1);
}

TEST(RefCntAutoPtrTest, QueryInterface)
{
    int NumDestroyed = 0;
    {
        RefCntAutoPtr<TestObject> pObj{new TestObject{NumDestroyed}};

        RefCntAutoPtr<IObject> pUnknown{pObj, IID_Unknown};
        EXPECT_NE(pUnknown, nullptr);

        RefCntAutoPtr<IObject> pTestObj{pObj, IID_TestObject};
        EXPECT_EQ(pTestObj, pUnknown);
        EXPECT_EQ(pObj->GetNumStrongRefs(), 3);

        // {00000000-0000-0000-0000-000000000001}
        static constexpr INTERFACE_ID IID_Unsupported = {0, 0, 0, {0, 0, 0, 0, 0, 0, 0, 1}};
        RefCntAutoPtr<IObject> pUnsupported{pObj, IID_Unsupported};
        EXPECT_EQ(pUnsupported, nullptr);
    }
    EXPECT_EQ(NumDestroyed, 1);
}

TEST(RefCntAutoPtrTest, DoublePointer)
{
    int NumDestroyed = 0;

    auto CreateObject = [&NumDestroyed](IObject** ppObject) {
        auto* pObj = new TestObject{NumDestroyed};
        pObj->QueryInterface(IID_TestObject, ppObject);
    };

    RefCntAutoPtr<IObject> pObj;
    CreateObject(&pObj);
    ASSERT_NE(pObj, nullptr);

    // Writing through the helper releases the previous object
    CreateObject(&pObj);
    EXPECT_EQ(NumDestroyed, 1);

    auto* pRaw = pObj.Detach();
    EXPECT_EQ(pObj, nullptr);
    pObj.Attach(pRaw);
    pObj.Release();
    EXPECT_EQ(NumDestroyed, 2);
}

} // namespace
